#include "wire_framer.h"
#include <QJsonDocument>

namespace {

bool isCompleteJson(const QByteArray& text)
{
    QJsonParseError err;
    QJsonDocument::fromJson(text, &err);
    return err.error == QJsonParseError::NoError;
}

}

WireFramer::WireFramer(WireFormat format)
    : m_format(format)
{
}

void WireFramer::reset()
{
    m_buffer.clear();
    m_jsonPending.clear();
}

QList<WireUnit> WireFramer::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);
    switch (m_format) {
    case WireFormat::Sse:       return takeSseEvents();
    case WireFormat::JsonLines: return takeJsonLines(false);
    case WireFormat::Whole:
    default:                    return {};
    }
}

QList<WireUnit> WireFramer::finish()
{
    QList<WireUnit> units;
    switch (m_format) {
    case WireFormat::Sse:
        units = takeSseEvents();
        if (!m_buffer.isEmpty()) {
            // Last event was not terminated by a blank line
            units.append(parseSseBlock(m_buffer));
            m_buffer.clear();
        }
        break;
    case WireFormat::JsonLines:
        units = takeJsonLines(true);
        break;
    case WireFormat::Whole: {
        WireUnit unit;
        unit.raw = m_buffer;
        unit.data = m_buffer.trimmed();
        m_buffer.clear();
        units.append(unit);
        break;
    }
    }
    return units;
}

QList<WireUnit> WireFramer::takeSseEvents()
{
    QList<WireUnit> units;

    while (true) {
        // "\r\n\r\n" is checked first so a CRLF stream is not cut mid-delimiter
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray raw = m_buffer.left(delimPos + delimLen);
        m_buffer.remove(0, delimPos + delimLen);
        units.append(parseSseBlock(raw));
    }

    return units;
}

WireUnit WireFramer::parseSseBlock(const QByteArray& raw)
{
    WireUnit unit;
    unit.raw = raw;

    QList<QByteArray> dataLines;
    const QList<QByteArray> lines = raw.split('\n');
    for (const QByteArray& rawLine : lines) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            unit.event = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
        }
        // id: and retry: carry nothing the gateway interprets
    }

    unit.data = dataLines.join('\n');
    return unit;
}

QList<WireUnit> WireFramer::takeJsonLines(bool atEnd)
{
    QList<WireUnit> units;

    while (true) {
        const int nl = m_buffer.indexOf('\n');
        QByteArray raw;
        if (nl >= 0) {
            raw = m_buffer.left(nl + 1);
            m_buffer.remove(0, nl + 1);
        } else if (atEnd && !m_buffer.isEmpty()) {
            raw = m_buffer;
            m_buffer.clear();
        } else {
            break;
        }

        WireUnit unit;
        unit.raw = raw;

        // Streamed JSON arrays put '[', ',' and ']' around the elements
        QByteArray line = raw.trimmed();
        if (m_jsonPending.isEmpty()) {
            while (line.startsWith('[') || line.startsWith(','))
                line = line.mid(1).trimmed();
            if (line == "]")
                line.clear();
        }

        if (!line.isEmpty()) {
            if (!m_jsonPending.isEmpty())
                m_jsonPending.append('\n');
            m_jsonPending.append(line);

            QByteArray candidate = m_jsonPending;
            bool complete = isCompleteJson(candidate);
            while (!complete && (candidate.endsWith(',') || candidate.endsWith(']'))) {
                candidate.chop(1);
                candidate = candidate.trimmed();
                complete = isCompleteJson(candidate);
            }
            if (complete) {
                unit.data = candidate;
                m_jsonPending.clear();
            }
        }
        units.append(unit);
    }

    if (atEnd && !m_jsonPending.isEmpty()) {
        // Let the adapter report the truncated value
        WireUnit tail;
        tail.data = m_jsonPending;
        m_jsonPending.clear();
        units.append(tail);
    }
    return units;
}

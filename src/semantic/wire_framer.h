#pragma once
#include "ports.h"
#include <QList>

class WireFramer {
public:
    explicit WireFramer(WireFormat format = WireFormat::Sse);

    void setFormat(WireFormat format) { m_format = format; }
    WireFormat format() const { return m_format; }

    QList<WireUnit> feed(const QByteArray& bytes);
    QList<WireUnit> finish();
    void reset();

    static WireUnit parseSseBlock(const QByteArray& raw);

private:
    WireFormat m_format;
    QByteArray m_buffer;
    QByteArray m_jsonPending;

    QList<WireUnit> takeSseEvents();
    QList<WireUnit> takeJsonLines(bool atEnd);
};

#include "message_assembler.h"
#include <QJsonDocument>

namespace {

// Drops whitespace outside string literals. Key order, duplicate keys and
// number literals stay exactly as the model wrote them.
QByteArray stripInsignificantWhitespace(const QByteArray& json)
{
    QByteArray out;
    out.reserve(json.size());
    bool inString = false;
    bool escaped = false;
    for (const char c : json) {
        if (inString) {
            out.append(c);
            if (escaped)
                escaped = false;
            else if (c == '\\')
                escaped = true;
            else if (c == '"')
                inString = false;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
            continue;
        if (c == '"')
            inString = true;
        out.append(c);
    }
    return out;
}

}

// ---------------------------------------------------------------------------
// Convenience batch API
// ---------------------------------------------------------------------------

Result<CanonicalMessage> MessageAssembler::assemble(const QList<StreamFrame>& frames)
{
    reset();
    for (const StreamFrame& frame : frames) {
        addFrame(frame);
    }
    auto result = complete(0);
    reset();
    return result;
}

// ---------------------------------------------------------------------------
// Incremental frame ingestion
// ---------------------------------------------------------------------------

void MessageAssembler::addFrame(const StreamFrame& frame)
{
    const bool known = m_states.contains(frame.candidateIndex);
    if (!known && frame.deltas.isEmpty() && !frame.role && !frame.messageComplete) {
        // Usage-only or keep-alive chunk
        return;
    }

    CandidateState& state = m_states[frame.candidateIndex];
    if (frame.role) {
        state.role = *frame.role;
    }
    for (const PartDelta& delta : frame.deltas) {
        applyDelta(state, delta);
    }
}

void MessageAssembler::applyDelta(CandidateState& state, const PartDelta& delta)
{
    int slot = delta.slot;

    if (slot >= 0 && state.parts.contains(slot) && state.parts[slot].kind != delta.kind) {
        // Provider reused an index for a different part kind; keep both
        slot = -1;
    }

    if (slot < 0) {
        // Text continues the trailing text part, everything else opens a new one
        if (delta.kind == PartKind::Text && !state.parts.isEmpty()
            && state.parts.last().kind == PartKind::Text) {
            state.parts.last().text.append(delta.text);
            return;
        }
        slot = state.parts.isEmpty() ? 0 : state.parts.lastKey() + 1;
    }

    auto it = state.parts.find(slot);
    if (it == state.parts.end()) {
        PartState part;
        part.kind = delta.kind;
        it = state.parts.insert(slot, part);
    }

    PartState& part = it.value();
    switch (delta.kind) {
    case PartKind::Text:
        part.text.append(delta.text);
        break;
    case PartKind::ToolCall:
        if (part.call.id.isEmpty() && !delta.callId.isEmpty())
            part.call.id = delta.callId;
        if (part.call.name.isEmpty() && !delta.name.isEmpty())
            part.call.name = delta.name;
        part.call.arguments.append(delta.argsFragment);
        break;
    case PartKind::BinaryRef:
        part.binary = delta.binary;
        break;
    case PartKind::ToolResult:
        break;
    }
}

// ---------------------------------------------------------------------------
// Completion: build the immutable message and validate tool arguments
// ---------------------------------------------------------------------------

Result<QByteArray> MessageAssembler::normalizeArguments(const ToolCall& call)
{
    const QByteArray raw = call.arguments.trimmed();
    if (raw.isEmpty()) {
        return QByteArrayLiteral("{}");
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::transport(
            QStringLiteral("invalid_tool_arguments"),
            QStringLiteral("Tool call '%1' (%2) completed with invalid arguments: %3")
                .arg(call.name, call.id, err.errorString())));
    }
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::transport(
            QStringLiteral("invalid_tool_arguments"),
            QStringLiteral("Tool call '%1' (%2) arguments are not a JSON object")
                .arg(call.name, call.id)));
    }
    return stripInsignificantWhitespace(raw);
}

Result<CanonicalMessage> MessageAssembler::complete(int candidateIndex)
{
    if (!m_states.contains(candidateIndex)) {
        CanonicalMessage empty;
        empty.index = candidateIndex;
        return empty;
    }

    const CandidateState state = m_states.take(candidateIndex);

    CanonicalMessage message;
    message.role = state.role;
    message.index = candidateIndex;

    for (auto it = state.parts.cbegin(); it != state.parts.cend(); ++it) {
        const PartState& part = it.value();
        switch (part.kind) {
        case PartKind::Text:
            if (!part.text.isEmpty())
                message.content.append(ContentPart::fromText(part.text));
            break;
        case PartKind::ToolCall: {
            auto args = normalizeArguments(part.call);
            if (!args) {
                return std::unexpected(args.error());
            }
            ToolCall call = part.call;
            call.arguments = *args;
            message.content.append(ContentPart::fromToolCall(call));
            break;
        }
        case PartKind::BinaryRef:
            message.content.append(ContentPart::fromBinary(part.binary));
            break;
        case PartKind::ToolResult:
            break;
        }
    }

    return message;
}

void MessageAssembler::reset()
{
    m_states.clear();
}

#pragma once
#include "semantic/frame.h"
#include "semantic/message.h"
#include "semantic/result.h"
#include <QMap>
#include <QList>

// Merges per-chunk deltas into complete canonical messages, one per candidate.
class MessageAssembler {
public:
    // Convenience: assemble a complete list of frames for candidate 0
    Result<CanonicalMessage> assemble(const QList<StreamFrame>& frames);

    void addFrame(const StreamFrame& frame);
    Result<CanonicalMessage> complete(int candidateIndex);
    QList<int> openCandidates() const { return m_states.keys(); }
    bool hasCandidate(int candidateIndex) const { return m_states.contains(candidateIndex); }
    void reset();

private:
    struct PartState {
        PartKind kind = PartKind::Text;
        QString text;
        ToolCall call;
        BinaryRef binary;
    };

    struct CandidateState {
        Role role = Role::Assistant;
        QMap<int, PartState> parts;  // slot -> part, iteration order is content order
    };

    QMap<int, CandidateState> m_states;

    void applyDelta(CandidateState& state, const PartDelta& delta);
    static Result<QByteArray> normalizeArguments(const ToolCall& call);
};

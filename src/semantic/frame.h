#pragma once
#include "message.h"
#include "types.h"
#include <QList>
#include <optional>

// One incremental piece of a content part. Parts sharing a slot merge;
// slot < 0 means "after everything seen so far".
struct PartDelta {
    PartKind kind = PartKind::Text;
    int slot = -1;
    QString text;
    QString callId;
    QString name;
    QByteArray argsFragment;
    BinaryRef binary;

    static PartDelta textDelta(const QString& text, int slot = -1) {
        PartDelta d;
        d.text = text;
        d.slot = slot;
        return d;
    }
    static PartDelta toolCallDelta(int slot, const QString& id, const QString& name,
                                   const QByteArray& fragment) {
        PartDelta d;
        d.kind = PartKind::ToolCall;
        d.slot = slot;
        d.callId = id;
        d.name = name;
        d.argsFragment = fragment;
        return d;
    }
    static PartDelta binaryDelta(const BinaryRef& ref, int slot = -1) {
        PartDelta d;
        d.kind = PartKind::BinaryRef;
        d.slot = slot;
        d.binary = ref;
        return d;
    }
};

struct StreamFrame {
    int candidateIndex = 0;
    std::optional<Role> role;
    QList<PartDelta> deltas;
    QString stopReason;
    bool messageComplete = false;
    bool streamEnd = false;
};

#pragma once
#include <QtGlobal>

enum class Role : quint8 {
    User, Assistant, System, Tool
};

enum class PartKind : quint8 {
    Text, ToolCall, ToolResult, BinaryRef
};

enum class ProviderFamily : quint8 {
    OpenAI, Anthropic, Gemini, Mcp
};

enum class WireFormat : quint8 {
    Sse,        // one unit per SSE event block
    JsonLines,  // one unit per line, JSON values may span lines
    Whole       // the complete body is one unit
};

enum class ErrorKind : quint8 {
    InvalidInput,           // 400
    CredentialError,        // 401
    GuardrailViolation,     // 400
    TransportError,         // 400
    SessionNotFound,        // 404
    UpstreamProviderError,  // upstream status
    GuardrailsUnavailable,  // 503
    TraceError,             // never reaches a client
    Timeout,                // 504
    Internal                // 500
};

enum class SessionState : quint8 {
    Negotiating, Open, Closing, Closed
};

enum class TransportKind : quint8 {
    LlmCall, McpSse, McpStreamableStateful, McpStreamableStateless, McpStdio
};

enum class PushState : quint8 {
    Pending, PartiallyPushed, Pushed, Failed
};

enum class PolicyDecision : quint8 {
    Allow, Block
};

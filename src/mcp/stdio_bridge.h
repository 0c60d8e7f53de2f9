#pragma once
#include "mcp_session.h"
#include <QByteArray>
#include <QFile>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QQueue>
#include <QStringList>

class QSocketNotifier;

struct StdioOptions {
    QString project;
    bool pushExplorer = false;
    QString program;
    QStringList arguments;
};

// `tracegate mcp`: runs a local MCP server as a child process and sits
// between it and the client on newline-delimited JSON-RPC over stdio.
class StdioBridge : public QObject {
    Q_OBJECT
public:
    static constexpr int kUsageExitCode = 2;
    static constexpr int kDrainTimeoutMs = 10000;

    // args are the words after "mcp"; everything behind --exec is the child
    static Result<StdioOptions> parseArguments(const QStringList& args);

    StdioBridge(const StdioOptions& options, const McpSessionOptions& sessionOptions,
                ITraceStore* traceStore, GuardrailsEngine* guardrails,
                QObject* parent = nullptr);
    ~StdioBridge() override;

    bool start();
    // Client side on the given descriptors instead of the process stdio
    bool start(int inputFd, int outputFd);
    McpSession* session() const { return m_session; }

signals:
    void finished(int exitCode);

private slots:
    void onStdinReadable();
    void onChildStdout();
    void onChildStderr();
    void onChildFinished(int exitCode, QProcess::ExitStatus status);
    void onChildError(QProcess::ProcessError error);

private:
    StdioOptions m_options;
    McpSession* m_session;
    QProcess* m_child;
    QSocketNotifier* m_stdinNotifier = nullptr;
    QFile m_stdin;
    QFile m_stdout;
    QByteArray m_childBuffer;
    QQueue<QByteArray> m_clientLines;
    bool m_screening = false;
    bool m_stdinClosed = false;
    bool m_finishing = false;

    void processNextClientLine();
    void writeToClient(const QByteArray& line);
    void writeToChild(const QByteArray& line);
    void shutdown(int exitCode);
};

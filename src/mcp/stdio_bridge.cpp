#include "stdio_bridge.h"
#include "core/log_manager.h"
#include "trace/trace_assembler.h"
#include <QJsonDocument>
#include <QSocketNotifier>
#include <QTimer>
#include <QUuid>
#include <cstdio>
#include <memory>

namespace {

QByteArray compact(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QJsonObject errorReply(const QJsonValue& id, int code, const QString& message)
{
    QJsonObject error;
    error["code"] = code;
    error["message"] = message;
    QJsonObject reply;
    reply["jsonrpc"] = QStringLiteral("2.0");
    reply["id"] = id;
    reply["error"] = error;
    return reply;
}

QJsonObject parseError(const QString& message)
{
    return errorReply(QJsonValue::Null, -32700, message);
}

QJsonObject internalError(const QJsonValue& id, const QString& message)
{
    return errorReply(id, -32603, message);
}

}

Result<StdioOptions> StdioBridge::parseArguments(const QStringList& args)
{
    StdioOptions options;
    const int execAt = args.indexOf(QStringLiteral("--exec"));
    if (execAt < 0 || execAt + 1 >= args.size())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_exec"),
            QStringLiteral("usage: tracegate mcp [--project-name NAME] [--push-explorer] --exec COMMAND [ARGS...]")));

    const QStringList own = args.mid(0, execAt);
    for (int i = 0; i < own.size(); ++i) {
        const QString& arg = own.at(i);
        if (arg == QStringLiteral("--push-explorer")) {
            options.pushExplorer = true;
        } else if (arg == QStringLiteral("--project-name")) {
            if (i + 1 >= own.size())
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("missing_value"), QStringLiteral("--project-name needs a value")));
            options.project = own.at(++i);
        } else if (arg.startsWith(QStringLiteral("--project-name="))) {
            options.project = arg.section(QLatin1Char('='), 1);
        } else {
            // Unknown gateway flags are tolerated
            LOG_WARNING(QStringLiteral("mcp: ignoring unknown option %1").arg(arg));
        }
    }

    if (options.project.isEmpty())
        options.project = QStringLiteral("mcp-capture-")
                          + QUuid::createUuid().toString(QUuid::Id128).left(8);

    options.program = args.at(execAt + 1);
    options.arguments = args.mid(execAt + 2);
    return options;
}

StdioBridge::StdioBridge(const StdioOptions& options, const McpSessionOptions& sessionOptions,
                         ITraceStore* traceStore, GuardrailsEngine* guardrails, QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_session(new McpSession(sessionOptions, traceStore, guardrails, this))
    , m_child(new QProcess(this))
{
    m_child->setProcessChannelMode(QProcess::SeparateChannels);
    connect(m_child, &QProcess::readyReadStandardOutput, this, &StdioBridge::onChildStdout);
    connect(m_child, &QProcess::readyReadStandardError, this, &StdioBridge::onChildStderr);
    connect(m_child, &QProcess::finished, this, &StdioBridge::onChildFinished);
    connect(m_child, &QProcess::errorOccurred, this, &StdioBridge::onChildError);
    connect(m_session, &McpSession::notifyClient, this, [this](const QJsonObject& message) {
        writeToClient(compact(message));
    });
}

StdioBridge::~StdioBridge()
{
    if (m_child->state() != QProcess::NotRunning) {
        m_child->kill();
        m_child->waitForFinished(1000);
    }
}

bool StdioBridge::start()
{
    return start(fileno(stdin), fileno(stdout));
}

bool StdioBridge::start(int inputFd, int outputFd)
{
    if (!m_stdout.open(outputFd, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        LOG_ERROR(QStringLiteral("mcp: cannot open stdout"));
        return false;
    }

    LOG_INFO(QStringLiteral("mcp: starting %1 %2 (project %3)")
                 .arg(m_options.program, m_options.arguments.join(QLatin1Char(' ')),
                      m_options.project));
    m_child->start(m_options.program, m_options.arguments);
    if (!m_child->waitForStarted(5000)) {
        LOG_ERROR(QStringLiteral("mcp: failed to start %1: %2")
                      .arg(m_options.program, m_child->errorString()));
        return false;
    }
    m_session->open();

    // By descriptor: a FILE* backed QFile would buffer lines the notifier never sees
    if (!m_stdin.open(inputFd, QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        LOG_ERROR(QStringLiteral("mcp: cannot open stdin"));
        return false;
    }
    m_stdinNotifier = new QSocketNotifier(m_stdin.handle(), QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &StdioBridge::onStdinReadable);
    return true;
}

// ------------------------------------------------------------------
// client -> server
// ------------------------------------------------------------------

void StdioBridge::onStdinReadable()
{
    // One line per wake-up, the notifier fires again while input remains
    const QByteArray raw = m_stdin.readLine();
    const bool eof = raw.isEmpty() || !raw.endsWith('\n');
    const QByteArray line = raw.trimmed();
    if (!line.isEmpty())
        m_clientLines.enqueue(line);

    if (eof) {
        m_stdinNotifier->setEnabled(false);
        m_stdinClosed = true;
    }
    processNextClientLine();
}

void StdioBridge::processNextClientLine()
{
    if (m_screening)
        return;
    if (m_clientLines.isEmpty()) {
        if (m_stdinClosed)
            m_child->closeWriteChannel();
        return;
    }

    const QByteArray line = m_clientLines.dequeue();
    bool isBatch = false;
    auto messages = JsonRpc::parse(line, &isBatch);
    if (!messages) {
        LOG_WARNING(QStringLiteral("mcp: malformed client line: %1").arg(messages.error().message));
        writeToClient(compact(parseError(messages.error().message)));
        processNextClientLine();
        return;
    }

    m_screening = true;
    QPointer<StdioBridge> guard(this);
    const QList<JsonRpcMessage> batch = *messages;
    m_session->screenClientMessages(batch, [guard, batch, isBatch](Result<McpSession::Screened> screened) {
        if (!guard)
            return;
        guard->m_screening = false;
        if (!screened) {
            // Nothing is forwarded unchecked; requests get an error instead
            LOG_ERROR(QStringLiteral("mcp: %1").arg(screened.error().message));
            for (const JsonRpcMessage& message : batch) {
                if (message.isRequest())
                    guard->writeToClient(compact(internalError(message.id(), screened.error().message)));
            }
        } else {
            if (!screened->forward.isEmpty())
                guard->writeToChild(JsonRpc::serialize(screened->forward, isBatch));
            for (const QJsonObject& reply : screened->replies)
                guard->writeToClient(compact(reply));
        }
        guard->processNextClientLine();
    });
}

void StdioBridge::writeToChild(const QByteArray& line)
{
    if (m_child->state() != QProcess::Running)
        return;
    m_child->write(line);
    m_child->write("\n");
}

// ------------------------------------------------------------------
// server -> client
// ------------------------------------------------------------------

void StdioBridge::onChildStdout()
{
    m_childBuffer.append(m_child->readAllStandardOutput());
    qsizetype nl;
    while ((nl = m_childBuffer.indexOf('\n')) >= 0) {
        const QByteArray line = m_childBuffer.left(nl).trimmed();
        m_childBuffer.remove(0, nl + 1);
        if (line.isEmpty())
            continue;

        auto messages = JsonRpc::parse(line);
        if (messages) {
            for (const JsonRpcMessage& message : *messages)
                m_session->handleServerMessage(message);
        } else {
            LOG_WARNING(QStringLiteral("mcp: server wrote a non JSON-RPC line"));
        }
        writeToClient(line);
    }
}

void StdioBridge::onChildStderr()
{
    const QByteArray data = m_child->readAllStandardError();
    std::fwrite(data.constData(), 1, data.size(), stderr);
    std::fflush(stderr);
}

void StdioBridge::writeToClient(const QByteArray& line)
{
    if (!m_stdout.isOpen())
        return;
    m_stdout.write(line);
    m_stdout.write("\n");
    m_stdout.flush();
}

// ------------------------------------------------------------------
// shutdown
// ------------------------------------------------------------------

void StdioBridge::onChildFinished(int exitCode, QProcess::ExitStatus status)
{
    onChildStdout();
    if (status == QProcess::CrashExit)
        LOG_WARNING(QStringLiteral("mcp: %1 crashed").arg(m_options.program));
    else
        LOG_INFO(QStringLiteral("mcp: %1 exited with %2").arg(m_options.program).arg(exitCode));
    shutdown(status == QProcess::NormalExit ? exitCode : 1);
}

void StdioBridge::onChildError(QProcess::ProcessError error)
{
    if (error == QProcess::FailedToStart) {
        // start() reports this one
        return;
    }
    LOG_WARNING(QStringLiteral("mcp: child process error: %1").arg(m_child->errorString()));
}

void StdioBridge::shutdown(int exitCode)
{
    if (m_finishing)
        return;
    m_finishing = true;
    if (m_stdinNotifier)
        m_stdinNotifier->setEnabled(false);

    // Let the last trace push land before exiting
    QPointer<TraceAssembler> trace = m_session->trace();
    m_session->close();
    if (!trace) {
        emit finished(exitCode);
        return;
    }

    auto done = std::make_shared<bool>(false);
    connect(trace, &QObject::destroyed, this, [this, done, exitCode]() {
        if (*done)
            return;
        *done = true;
        emit finished(exitCode);
    });
    QTimer::singleShot(kDrainTimeoutMs, this, [this, done, exitCode]() {
        if (*done)
            return;
        *done = true;
        LOG_WARNING(QStringLiteral("mcp: trace did not drain in time"));
        emit finished(exitCode);
    });
}

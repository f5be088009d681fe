#include "process_supervisor.h"
#include "cancellation_controller.h"
#include "command_builder.h"
#include "output_classifier.h"
#include "tool_profile.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <cerrno>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>
#endif

ProcessSupervisor::ProcessSupervisor(CancellationController& cancel) : m_cancel(cancel) {}

ProcessSupervisor::~ProcessSupervisor()
{
    // Never leave a tool running behind a destroyed supervisor.
    if (isRunning()) terminate();
}

ProcessSupervisor::StartStatus ProcessSupervisor::start(const ToolCommand& cmd, QString* errorOut)
{
    if (!cmd.isResolved()) {
        if (errorOut) {
            *errorOut = QObject::tr("%1 not found. Install it or set its location with --tool.").arg(cmd.toolName);
        }
        qWarning() << "[ProcessSupervisor] Tool not found:" << cmd.toolName;
        return StartStatus::ToolNotFound;
    }

    m_proc = std::make_unique<QProcess>();
    m_proc->setProcessChannelMode(QProcess::MergedChannels);
    m_proc->setStandardInputFile(QProcess::nullDevice());
    m_proc->setProgram(cmd.program);
    m_proc->setArguments(cmd.arguments);
#ifdef Q_OS_WIN
    m_proc->setCreateProcessArgumentsModifier([](QProcess::CreateProcessArguments* args) {
        args->flags |= CREATE_NEW_PROCESS_GROUP;
    });
#else
    m_proc->setChildProcessModifier([] { ::setsid(); });
#endif

    qInfo() << "[ProcessSupervisor] Starting" << cmd.program << cmd.arguments;
    m_proc->start();
    if (!m_proc->waitForStarted(kStartTimeoutMs)) {
        const QString reason = m_proc->errorString();
        qWarning() << "[ProcessSupervisor] Failed to start" << cmd.program << reason;
        const bool missing = !QFileInfo::exists(cmd.program);
        if (errorOut) {
            *errorOut = missing ? QObject::tr("%1 not found at %2").arg(cmd.toolName, cmd.program)
                                : QObject::tr("Failed to start %1: %2").arg(cmd.toolName, reason);
        }
        m_proc.reset();
        return missing ? StartStatus::ToolNotFound : StartStatus::FailedToStart;
    }

    m_forwardedRequests = 0;
    return StartStatus::Started;
}

ProcessSupervisor::StreamEnd ProcessSupervisor::readLines(const std::function<void(const QByteArray&)>& onLine)
{
    if (!m_proc) return StreamEnd::Eof;

    LineSplitter splitter;
    auto drain = [&]() -> bool {
        while (splitter.hasLine()) {
            if (m_cancel.isCancelRequested()) return false;
            onLine(splitter.takeLine());
        }
        return true;
    };

    for (;;) {
        if (!drain() || m_cancel.isCancelRequested()) return StreamEnd::Canceled;

        if (m_proc->bytesAvailable() > 0) {
            splitter.append(m_proc->readAll());
            continue;
        }
        if (m_proc->state() == QProcess::NotRunning) break;

        // false on timeout as well as on exit; the state tells them apart
        if (m_proc->waitForReadyRead(kPollIntervalMs) || m_proc->state() == QProcess::NotRunning) {
            splitter.append(m_proc->readAll());
        }
    }

    splitter.append(m_proc->readAll());
    splitter.finish();
    if (!drain()) return StreamEnd::Canceled;
    return StreamEnd::Eof;
}

int ProcessSupervisor::waitForExit()
{
    if (!m_proc) return -1;
    if (m_proc->state() != QProcess::NotRunning) m_proc->waitForFinished(-1);

    if (m_proc->exitStatus() == QProcess::CrashExit) {
        qWarning() << "[ProcessSupervisor] Tool terminated abnormally:" << m_proc->errorString();
        return -1;
    }
    const int code = m_proc->exitCode();
    qInfo() << "[ProcessSupervisor] Tool exited with code" << code;
    return code;
}

void ProcessSupervisor::terminate()
{
    if (!isRunning()) return;
    const qint64 pid = m_proc->processId();
    if (pid <= 0) return;

    terminateProcessTree(pid);
    m_forwardedRequests = m_cancel.requestCount();

    QElapsedTimer grace;
    grace.start();
    while (grace.elapsed() < kTerminateGraceMs) {
        if (m_proc->waitForFinished(kPollIntervalMs) || !isRunning()) return;
        forwardCancelRequests();
    }
    qWarning() << "[ProcessSupervisor] Tool ignored termination, killing pid" << pid;
    killProcessTree(pid);
    m_proc->waitForFinished(kKillWaitMs);
}

void ProcessSupervisor::forwardCancelRequests()
{
    // NotRunning means QProcess has reaped the child; its id may already be reused.
    if (!isRunning()) return;
    const int requests = m_cancel.requestCount();
    if (requests <= m_forwardedRequests) return;
    m_forwardedRequests = requests;
    terminateProcessTree(m_proc->processId());
}

bool ProcessSupervisor::isRunning() const
{
    return m_proc && m_proc->state() != QProcess::NotRunning;
}

qint64 ProcessSupervisor::processId() const
{
    return m_proc ? m_proc->processId() : 0;
}

RunOutcome ProcessSupervisor::resolveOutcome(const ToolProfile& profile, int exitCode, bool wasCanceled)
{
    if (wasCanceled) return RunOutcome::canceled();
    if (profile.isSuccessExitCode(exitCode)) return RunOutcome::success();
    return RunOutcome::failed(exitCode);
}

#ifdef Q_OS_WIN

static void runTaskkill(qint64 pid)
{
    // /T takes the whole tree started by the tool
    const bool ok = QProcess::startDetached(QStringLiteral("taskkill"),
                                            { "/PID", QString::number(pid), "/T", "/F" });
    if (!ok) qWarning() << "[ProcessSupervisor] taskkill could not be started for pid" << pid;
}

void ProcessSupervisor::terminateProcessTree(qint64 pid)
{
    if (pid <= 0) return;
    runTaskkill(pid);
}

void ProcessSupervisor::killProcessTree(qint64 pid)
{
    if (pid <= 0) return;
    HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (h) {
        TerminateProcess(h, 1);
        CloseHandle(h);
    }
    runTaskkill(pid);
}

#else

static void signalGroup(qint64 pid, int sig)
{
    // The child called setsid(), so its pid is also its process group id.
    if (::kill(-static_cast<pid_t>(pid), sig) == 0) return;
    if (errno == ESRCH) return; // already gone
    qWarning() << "[ProcessSupervisor]" << QString("kill(-%1) failed (errno %2), signalling the leader only").arg(pid).arg(errno);
    ::kill(static_cast<pid_t>(pid), sig);
}

void ProcessSupervisor::terminateProcessTree(qint64 pid)
{
    if (pid <= 0) return;
    signalGroup(pid, SIGTERM);
}

void ProcessSupervisor::killProcessTree(qint64 pid)
{
    if (pid <= 0) return;
    signalGroup(pid, SIGKILL);
}

#endif

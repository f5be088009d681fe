#pragma once

#include <QProcess>
#include <QString>
#include <functional>
#include <memory>

#include "run_outcome.h"

class CancellationController;
class ToolProfile;
struct ToolCommand;

/**
 * @brief Owns the external tool's process for the duration of one run.
 *
 * The child is started as the leader of a new session (POSIX) or process
 * group (Windows) so that a termination request also reaches whatever the
 * tool spawns itself. stdout and stderr arrive merged.
 *
 * All members except resolveOutcome() must be called from the worker
 * thread that called start(). Termination signals are only ever sent from
 * there, while the child is known not to have been reaped, so a recycled
 * process group id is never signalled.
 */
class ProcessSupervisor {
public:
    enum class StartStatus { Started, ToolNotFound, FailedToStart };
    enum class StreamEnd { Eof, Canceled };

    explicit ProcessSupervisor(CancellationController& cancel);
    ~ProcessSupervisor();
    Q_DISABLE_COPY(ProcessSupervisor)

    StartStatus start(const ToolCommand& cmd, QString* errorOut);

    // Blocks until the merged output reaches EOF or a cancel is observed,
    // calling onLine for every line in arrival order. The cancel flag is
    // checked before each line and on every idle poll.
    StreamEnd readLines(const std::function<void(const QByteArray&)>& onLine);

    // After Eof: reap the child. Returns its exit code, or -1 when it died from a signal.
    int waitForExit();

    // After Canceled: signal the process group, give it a grace period, then kill it.
    // Cancels requested during the grace period re-send the signal.
    void terminate();

    bool isRunning() const;
    qint64 processId() const;

    static RunOutcome resolveOutcome(const ToolProfile& profile, int exitCode, bool wasCanceled);

private:
    // Signal the group for every cancel request not yet forwarded.
    void forwardCancelRequests();

    static void terminateProcessTree(qint64 pid);
    static void killProcessTree(qint64 pid);

    static constexpr int kStartTimeoutMs = 10000;
    static constexpr int kPollIntervalMs = 100;
    static constexpr int kTerminateGraceMs = 5000;
    static constexpr int kKillWaitMs = 2000;

    CancellationController& m_cancel;
    std::unique_ptr<QProcess> m_proc;
    int m_forwardedRequests = 0;
};

#pragma once

#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <atomic>

#include "cancellation_controller.h"
#include "copy_configuration.h"
#include "run_outcome.h"
#include "tool_profile.h"

// Values the runner needs from its host, passed in once at construction.
struct RunnerEnvironment {
    ToolPlatform platform = ToolProfile::hostPlatform();
    QString toolPath; // use this executable instead of locating the tool
};

/**
 * @brief Runs one copy at a time on a dedicated worker thread.
 *
 * start() returns immediately. The worker validates the configuration,
 * refuses recursive copies, builds and launches the tool, and turns its
 * output into progressChanged()/logLine() signals. Exactly one runFinished()
 * follows, after every other signal of the run. All signals are delivered
 * on the thread that owns the runner, in the order the worker produced them.
 */
class CopyRunner : public QObject {
    Q_OBJECT
public:
    explicit CopyRunner(const RunnerEnvironment& env = RunnerEnvironment(), QObject* parent = nullptr);
    ~CopyRunner() override;

    // False (and nothing else happens) while a run is active.
    bool start(const CopyConfiguration& config);
    bool isRunning() const { return m_running.load(); }

signals:
    void progressChanged(int percent);
    void logLine(const QString& line);
    void runFinished(const RunOutcome& outcome);

public slots:
    // Never blocks; the outcome arrives later through runFinished().
    void cancel();

private:
    RunOutcome execute(const CopyConfiguration& config); // worker thread
    void postLog(const QString& line);
    void postProgress(int percent);

    const RunnerEnvironment m_env;
    CancellationController m_cancel;
    std::atomic_bool m_running{false};
    QThreadPool m_pool;
    QFutureWatcher<RunOutcome> m_watcher;
};

#include "copy_runner.h"
#include "command_builder.h"
#include "output_classifier.h"
#include "post_move_cleanup.h"
#include "process_supervisor.h"
#include "recursive_guard.h"

#include <QDebug>
#include <QDir>
#include <QMetaObject>
#include <QtConcurrent>

CopyRunner::CopyRunner(const RunnerEnvironment& env, QObject* parent)
    : QObject(parent)
    , m_env(env)
{
    qRegisterMetaType<RunOutcome>("RunOutcome");
    m_pool.setMaxThreadCount(1);

    connect(&m_watcher, &QFutureWatcher<RunOutcome>::finished, this, [this]{
        const RunOutcome outcome = m_watcher.result();
        m_running.store(false);
        qInfo() << "[CopyRunner] Finished:" << outcome.toString();
        emit runFinished(outcome);
    });
}

CopyRunner::~CopyRunner()
{
    if (m_running.load()) {
        m_cancel.requestCancel();
        m_watcher.waitForFinished();
    }
}

bool CopyRunner::start(const CopyConfiguration& config)
{
    if (m_running.exchange(true)) {
        qWarning() << "[CopyRunner] Copy already running; start request ignored";
        return false;
    }
    m_cancel.reset();

    qInfo() << "[CopyRunner] Start" << config.sourcePath << "->" << config.destinationPath
            << "move=" << config.move << "invert=" << config.invert
            << "ignoreExisting=" << config.ignoreExisting << "compress=" << config.compress
            << "delete=" << config.deleteExtraneous;

    m_watcher.setFuture(QtConcurrent::run(&m_pool, [this, config]() { return execute(config); }));
    return true;
}

void CopyRunner::cancel()
{
    if (!m_running.load()) return;
    m_cancel.requestCancel();
}

void CopyRunner::postLog(const QString& line)
{
    QMetaObject::invokeMethod(this, [this, line]{ emit logLine(line); }, Qt::QueuedConnection);
}

void CopyRunner::postProgress(int percent)
{
    QMetaObject::invokeMethod(this, [this, percent]{ emit progressChanged(percent); }, Qt::QueuedConnection);
}

RunOutcome CopyRunner::execute(const CopyConfiguration& config)
{
    const EffectivePaths paths = effectivePaths(config);

    QString err;
    if (!validateConfiguration(config, &err)) {
        qWarning() << "[CopyRunner] Invalid configuration:" << err;
        postLog(err);
        return RunOutcome::failed(-1);
    }
    if (RecursiveGuard::check(paths.source, paths.destination)) {
        qWarning() << "[CopyRunner] Recursive copy refused:" << paths.source << paths.destination;
        postLog(tr("Refusing to copy: one folder is inside the other (%1, %2).")
                    .arg(QDir::toNativeSeparators(paths.source), QDir::toNativeSeparators(paths.destination)));
        return RunOutcome::failed(-1);
    }

    const std::unique_ptr<ToolProfile> profile = ToolProfile::create(m_env.platform);
    CommandBuilder builder(*profile);
    builder.setProgramOverride(m_env.toolPath);
    const ToolCommand cmd = builder.build(paths, config);

    if (m_cancel.isCancelRequested()) {
        postLog(tr("Copy canceled by user."));
        return RunOutcome::canceled();
    }

    ProcessSupervisor supervisor(m_cancel);
    const ProcessSupervisor::StartStatus status = supervisor.start(cmd, &err);
    if (status != ProcessSupervisor::StartStatus::Started) {
        postLog(err);
        return RunOutcome::failed(-1);
    }
    for (const QString& w : cmd.warnings) postLog(w);
    postLog(cmd.displayString());

    OutputClassifier classifier(*profile);
    int lastPercent = -1;
    const ProcessSupervisor::StreamEnd end = supervisor.readLines([&](const QByteArray& raw) {
        const ClassifiedLine c = classifier.classify(classifier.decode(raw));
        switch (c.kind) {
            case ClassifiedLine::Kind::Progress:
                if (c.percent != lastPercent) {
                    lastPercent = c.percent;
                    postProgress(c.percent);
                }
                break;
            case ClassifiedLine::Kind::Log:
                postLog(c.text);
                break;
            case ClassifiedLine::Kind::Dropped:
                break;
        }
    });

    int exitCode = -1;
    bool canceled = false;
    if (end == ProcessSupervisor::StreamEnd::Canceled) {
        supervisor.terminate();
        canceled = true;
    } else {
        exitCode = supervisor.waitForExit();
        canceled = m_cancel.isCancelRequested();
    }

    const RunOutcome outcome = ProcessSupervisor::resolveOutcome(*profile, exitCode, canceled);
    if (outcome.isCanceled()) {
        postLog(tr("Copy canceled by user."));
    } else if (outcome.isSuccess()) {
        if (config.move && profile->leavesEmptySourceDirsOnMove()) {
            const PostMoveCleanup::Result cleanup = PostMoveCleanup::run(paths.source);
            for (const QString& w : cleanup.warnings) postLog(w);
        }
        postLog(tr("Copy complete!"));
    } else {
        postLog(tr("%1 failed with exit code %2.").arg(cmd.toolName).arg(outcome.exitCode));
    }
    return outcome;
}

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>

#include "copy_runner.h"
#include "log_manager.h"
#include "progress_manager.h"
#include "settings_store.h"

namespace {

std::atomic_int g_interrupts{0};

void onInterrupt(int)
{
    g_interrupts.fetch_add(1);
}

int exitCodeFor(const RunOutcome& outcome)
{
    if (outcome.isSuccess()) return 0;
    if (outcome.isCanceled()) return 2;
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("FastCopy");
    QCoreApplication::setApplicationName("FastCopy");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy or move a folder's contents with rsync (macOS/Linux) or robocopy (Windows).");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source", "Folder whose contents are copied (defaults to the saved one).", "[source]");
    parser.addPositionalArgument("destination", "Target folder (defaults to the saved one).", "[destination]");

    QCommandLineOption moveOpt("move", "Remove source files once they are transferred.");
    QCommandLineOption invertOpt("invert", "Swap source and destination for this run.");
    QCommandLineOption ignoreOpt("ignore-existing", "Skip files that already exist at the destination.");
    QCommandLineOption compressOpt("compress", "Compress data in transit (rsync only).");
    QCommandLineOption deleteOpt("delete", "Delete destination files that are not in the source.");
    QCommandLineOption toolOpt("tool", "Use this rsync/robocopy executable.", "path");
    QCommandLineOption saveOpt("save", "Remember the resulting settings for the next run.");
    QCommandLineOption noProgressOpt("no-progress", "Do not draw the progress bar.");
    QCommandLineOption verboseOpt({"V", "verbose"}, "Echo diagnostic messages to stderr.");
    parser.addOptions({ moveOpt, invertOpt, ignoreOpt, compressOpt, deleteOpt, toolOpt, saveOpt, noProgressOpt, verboseOpt });
    parser.process(app);

    qInstallMessageHandler(customMessageHandler);
    LogManager& logManager = LogManager::instance();
    logManager.setConsoleLevel(parser.isSet(verboseOpt) ? LogManager::Level::Debug : LogManager::Level::Error);
    if (!logManager.openLogFile(defaultLogFilePath())) {
        fprintf(stderr, "warning: cannot write log file %s\n", qPrintable(defaultLogFilePath()));
    }
    logManager.addLog("[MAIN] Started, log file " + logManager.logFilePath());

    SettingsStore settings;
    CopyConfiguration config = settings.loadConfiguration();

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 2) {
        fprintf(stderr, "Too many arguments.\n");
        parser.showHelp(1);
    }
    if (positional.size() >= 1) config.sourcePath = QFileInfo(positional.at(0)).absoluteFilePath();
    if (positional.size() >= 2) config.destinationPath = QFileInfo(positional.at(1)).absoluteFilePath();
    if (parser.isSet(moveOpt)) config.move = true;
    if (parser.isSet(invertOpt)) config.invert = true;
    if (parser.isSet(ignoreOpt)) config.ignoreExisting = true;
    if (parser.isSet(compressOpt)) config.compress = true;
    if (parser.isSet(deleteOpt)) config.deleteExtraneous = true;

    QString toolPath = settings.toolPath();
    if (parser.isSet(toolOpt)) toolPath = parser.value(toolOpt);

    if (parser.isSet(saveOpt)) {
        settings.saveConfiguration(config);
        settings.setToolPath(toolPath);
    }

    RunnerEnvironment env;
    env.toolPath = toolPath;
    CopyRunner runner(env);
    ProgressManager progress(!parser.isSet(noProgressOpt));

    int rc = 1;
    QObject::connect(&runner, &CopyRunner::progressChanged, &progress, &ProgressManager::update);
    QObject::connect(&runner, &CopyRunner::logLine, &progress, &ProgressManager::log);
    QObject::connect(&runner, &CopyRunner::runFinished, &app, [&](const RunOutcome& outcome) {
        progress.finish(outcome);
        LogManager::instance().addLog("[MAIN] Run finished: " + outcome.toString());
        rc = exitCodeFor(outcome);
        app.quit();
    });

    // The tool runs in its own session, so the terminal's Ctrl+C never reaches
    // it; forward interrupts as a cancel request instead.
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
    QTimer interruptPoll;
    int handledInterrupts = 0;
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&]() {
        const int seen = g_interrupts.load();
        if (seen == handledInterrupts) return;
        if (handledInterrupts == 0) {
            progress.log("Canceling copy, waiting for the tool to stop...");
            runner.cancel();
        }
        handledInterrupts = seen;
    });
    interruptPoll.start(100);

    const EffectivePaths paths = effectivePaths(config);
    progress.start(QString("%1 -> %2").arg(QDir::toNativeSeparators(paths.source), QDir::toNativeSeparators(paths.destination)));
    if (!runner.start(config)) {
        return 1;
    }

    app.exec();
    return rc;
}

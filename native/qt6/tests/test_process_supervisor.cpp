#include <QtTest>
#include <QElapsedTimer>
#include <QFile>
#include <QThread>
#include <QTemporaryDir>
#include "../src/cancellation_controller.h"
#include "../src/command_builder.h"
#include "../src/process_supervisor.h"
#include "../src/tool_profile.h"

#ifndef Q_OS_WIN
#include <unistd.h>
#endif

class TestProcessSupervisor : public QObject {
    Q_OBJECT
private slots:
    void testResolveOutcome_data();
    void testResolveOutcome();
    void testMissingToolNeverSpawns();
    void testMergedOutputAndExitCode();
    void testUnterminatedLastLine();
    void testChildLeadsItsOwnProcessGroup();
    void testCancelStopsReadingAndTerminates();
    void testCancelBeforeStartStillTerminates();
    void testRepeatedCancelResignalsDuringGrace();
    void testCancelAfterExitSignalsNothing();
};

static ToolCommand shellCommand(const QString& script)
{
    ToolCommand cmd;
    cmd.toolName = "sh";
    cmd.program = "/bin/sh";
    cmd.arguments = QStringList{ "-c", script };
    return cmd;
}

void TestProcessSupervisor::testResolveOutcome_data()
{
    QTest::addColumn<int>("platform");
    QTest::addColumn<int>("exitCode");
    QTest::addColumn<bool>("canceled");
    QTest::addColumn<RunOutcome>("expected");

    const int posix = int(ToolPlatform::PosixSync);
    const int windows = int(ToolPlatform::WindowsCopy);
    QTest::newRow("rsync ok") << posix << 0 << false << RunOutcome::success();
    QTest::newRow("rsync partial transfer") << posix << 23 << false << RunOutcome::failed(23);
    QTest::newRow("rsync canceled with 0") << posix << 0 << true << RunOutcome::canceled();
    QTest::newRow("rsync canceled with 20") << posix << 20 << true << RunOutcome::canceled();
    QTest::newRow("robocopy copied+extra") << windows << 5 << false << RunOutcome::success();
    QTest::newRow("robocopy nothing to do") << windows << 0 << false << RunOutcome::success();
    QTest::newRow("robocopy upper bound") << windows << 7 << false << RunOutcome::success();
    QTest::newRow("robocopy failure") << windows << 8 << false << RunOutcome::failed(8);
    QTest::newRow("robocopy failure 9") << windows << 9 << false << RunOutcome::failed(9);
    QTest::newRow("robocopy crashed") << windows << -1 << false << RunOutcome::failed(-1);
    QTest::newRow("robocopy canceled") << windows << 3 << true << RunOutcome::canceled();
}

void TestProcessSupervisor::testResolveOutcome()
{
    QFETCH(int, platform);
    QFETCH(int, exitCode);
    QFETCH(bool, canceled);
    QFETCH(RunOutcome, expected);

    const auto profile = ToolProfile::create(static_cast<ToolPlatform>(platform));
    const RunOutcome got = ProcessSupervisor::resolveOutcome(*profile, exitCode, canceled);
    QCOMPARE(got.toString(), expected.toString());
    QVERIFY(got == expected);
}

void TestProcessSupervisor::testMissingToolNeverSpawns()
{
    CancellationController cancel;
    ProcessSupervisor sup(cancel);

    ToolCommand cmd;
    cmd.toolName = "rsync";
    QString err;
    QCOMPARE(sup.start(cmd, &err), ProcessSupervisor::StartStatus::ToolNotFound);
    QVERIFY(err.contains("rsync"));
    QVERIFY(!sup.isRunning());
    QCOMPARE(sup.processId(), qint64(0));

    QTemporaryDir tmp;
    cmd.program = tmp.filePath("no-such-tool");
    err.clear();
    QCOMPARE(sup.start(cmd, &err), ProcessSupervisor::StartStatus::ToolNotFound);
    QVERIFY(!err.isEmpty());
}

void TestProcessSupervisor::testMergedOutputAndExitCode()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand("echo out; echo err 1>&2; exit 3"), &err), ProcessSupervisor::StartStatus::Started);
    QVERIFY(sup.processId() > 0);

    QStringList lines;
    QCOMPARE(sup.readLines([&](const QByteArray& l) { lines << QString::fromUtf8(l); }), ProcessSupervisor::StreamEnd::Eof);
    QVERIFY(lines.contains("out"));
    QVERIFY(lines.contains("err"));
    QCOMPARE(sup.waitForExit(), 3);
#endif
}

void TestProcessSupervisor::testUnterminatedLastLine()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand("printf 'first\\nsecond'"), &err), ProcessSupervisor::StartStatus::Started);
    QStringList lines;
    QCOMPARE(sup.readLines([&](const QByteArray& l) { lines << QString::fromUtf8(l); }), ProcessSupervisor::StreamEnd::Eof);
    QCOMPARE(lines, QStringList({ "first", "second" }));
    QCOMPARE(sup.waitForExit(), 0);
#endif
}

void TestProcessSupervisor::testChildLeadsItsOwnProcessGroup()
{
#ifdef Q_OS_WIN
    QSKIP("POSIX process groups");
#else
    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand("echo ready; sleep 30"), &err), ProcessSupervisor::StartStatus::Started);
    const pid_t pid = static_cast<pid_t>(sup.processId());
    QVERIFY(pid > 0);
    QCOMPARE(::getpgid(pid), pid);
    QVERIFY(::getpgid(pid) != ::getpgrp());

    cancel.requestCancel();
    QCOMPARE(sup.readLines([](const QByteArray&) {}), ProcessSupervisor::StreamEnd::Canceled);
    sup.terminate();
    QVERIFY(!sup.isRunning());
#endif
}

void TestProcessSupervisor::testCancelStopsReadingAndTerminates()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    // The grandchild (sleep) keeps the pipe open unless the whole group is signalled
    QCOMPARE(sup.start(shellCommand("echo started; sleep 30 & wait; echo never"), &err),
             ProcessSupervisor::StartStatus::Started);

    QElapsedTimer timer;
    timer.start();
    QStringList lines;
    const auto end = sup.readLines([&](const QByteArray& l) {
        lines << QString::fromUtf8(l);
        if (l == "started") cancel.requestCancel();
    });
    QCOMPARE(end, ProcessSupervisor::StreamEnd::Canceled);
    QCOMPARE(lines, QStringList({ "started" }));

    sup.terminate();
    QVERIFY(!sup.isRunning());
    QVERIFY(timer.elapsed() < 10000);

    const auto profile = ToolProfile::create(ToolPlatform::PosixSync);
    QVERIFY(ProcessSupervisor::resolveOutcome(*profile, 0, cancel.isCancelRequested()).isCanceled());
#endif
}

void TestProcessSupervisor::testCancelBeforeStartStillTerminates()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    CancellationController cancel;
    cancel.requestCancel();
    // repeated requests are harmless
    cancel.requestCancel();
    QVERIFY(cancel.isCancelRequested());

    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand("sleep 30"), &err), ProcessSupervisor::StartStatus::Started);
    QCOMPARE(sup.readLines([](const QByteArray&) {}), ProcessSupervisor::StreamEnd::Canceled);
    sup.terminate();
    QVERIFY(!sup.isRunning());

    cancel.reset();
    QVERIFY(!cancel.isCancelRequested());
#endif
}

void TestProcessSupervisor::testRepeatedCancelResignalsDuringGrace()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString received = tmp.filePath("signals");
    // Survives SIGTERM and records each one
    const QString script = QString("trap 'echo term >> \"%1\"' TERM; echo started; while :; do sleep 0.2; done").arg(received);

    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand(script), &err), ProcessSupervisor::StartStatus::Started);
    const auto end = sup.readLines([&](const QByteArray& l) {
        if (l == "started") cancel.requestCancel();
    });
    QCOMPARE(end, ProcessSupervisor::StreamEnd::Canceled);

    QScopedPointer<QThread> caller(QThread::create([&cancel] {
        QThread::msleep(1000);
        cancel.requestCancel();
    }));
    caller->start();
    sup.terminate(); // grace period runs out, then SIGKILL
    QVERIFY(caller->wait(10000));
    QVERIFY(!sup.isRunning());
    QCOMPARE(cancel.requestCount(), 2);

    QFile f(received);
    QVERIFY(f.open(QIODevice::ReadOnly));
    QCOMPARE(f.readAll().count("term"), 2);
#endif
}

void TestProcessSupervisor::testCancelAfterExitSignalsNothing()
{
#ifdef Q_OS_WIN
    QSKIP("Uses /bin/sh");
#else
    CancellationController cancel;
    ProcessSupervisor sup(cancel);
    QString err;
    QCOMPARE(sup.start(shellCommand("echo done"), &err), ProcessSupervisor::StartStatus::Started);
    QCOMPARE(sup.readLines([](const QByteArray&) {}), ProcessSupervisor::StreamEnd::Eof);
    QCOMPARE(sup.waitForExit(), 0);

    // The child is reaped; its id may already belong to someone else.
    cancel.requestCancel();
    QElapsedTimer timer;
    timer.start();
    sup.terminate();
    QVERIFY(timer.elapsed() < 1000);
    QVERIFY(!sup.isRunning());
    QVERIFY(ProcessSupervisor::resolveOutcome(PosixSyncTool(), 0, cancel.isCancelRequested()).isCanceled());
#endif
}

QTEST_GUILESS_MAIN(TestProcessSupervisor)
#include "test_process_supervisor.moc"

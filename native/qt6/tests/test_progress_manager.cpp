#include <QtTest>
#include "../src/progress_manager.h"

class TestProgressManager : public QObject {
    Q_OBJECT
private slots:
    void testRenderBar();
    void testRenderBarClamps();
    void testUpdateIgnoredWhenIdle();
    void testFinishCompletesOnSuccess();
};

void TestProgressManager::testRenderBar()
{
    QCOMPARE(ProgressManager::renderBar(0, 10), QString("[..........]   0%"));
    QCOMPARE(ProgressManager::renderBar(42, 10), QString("[####......]  42%"));
    QCOMPARE(ProgressManager::renderBar(100, 10), QString("[##########] 100%"));
}

void TestProgressManager::testRenderBarClamps()
{
    QCOMPARE(ProgressManager::renderBar(-5, 4), QString("[....]   0%"));
    QCOMPARE(ProgressManager::renderBar(250, 4), QString("[####] 100%"));
}

void TestProgressManager::testUpdateIgnoredWhenIdle()
{
    ProgressManager pm(false);
    pm.update(50);
    QVERIFY(!pm.isActive());
    QCOMPARE(pm.percentage(), 0);

    pm.start("copying");
    pm.update(50);
    QVERIFY(pm.isActive());
    QCOMPARE(pm.percentage(), 50);
}

void TestProgressManager::testFinishCompletesOnSuccess()
{
    ProgressManager pm(false);
    pm.start("copying");
    pm.update(97);
    pm.finish(RunOutcome::success());
    QVERIFY(!pm.isActive());
    QCOMPARE(pm.percentage(), 100);

    pm.start("copying");
    pm.update(30);
    pm.finish(RunOutcome::canceled());
    QCOMPARE(pm.percentage(), 30);
}

QTEST_APPLESS_MAIN(TestProgressManager)
#include "test_progress_manager.moc"

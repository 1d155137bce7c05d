#include <QtTest/QtTest>

#include "common/cli_args.hpp"

class CliArgsTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testDebugTraceFlagRemoved();
    void testProgramNameKept();
    void testEnvironmentEnablesTrace();
};

void CliArgsTests::init()
{
    qunsetenv("TRACEWATCH_DEBUG_TRACE");
}

void CliArgsTests::testDebugTraceFlagRemoved()
{
    char prog[] = "tracewatch-report";
    char cmd[] = "daily";
    char flag[] = "--debug-trace";
    char fmt[] = "--format";
    char *argv[] = {prog, cmd, flag, fmt, nullptr};

    tracewatch::CliArgs args(4, argv);
    QVERIFY(args.debugTrace());
    QCOMPARE(args.argc(), 3);
    QCOMPARE(QString::fromLocal8Bit(args.argv()[1]), QStringLiteral("daily"));
    QCOMPARE(QString::fromLocal8Bit(args.argv()[2]), QStringLiteral("--format"));
    QVERIFY(args.argv()[3] == nullptr);
}

void CliArgsTests::testProgramNameKept()
{
    char prog[] = "--debug-trace";
    char *argv[] = {prog, nullptr};

    tracewatch::CliArgs args(1, argv);
    QVERIFY(!args.debugTrace());
    QCOMPARE(args.argc(), 1);
}

void CliArgsTests::testEnvironmentEnablesTrace()
{
    qputenv("TRACEWATCH_DEBUG_TRACE", "1");
    char prog[] = "tracewatch-focus";
    char *argv[] = {prog, nullptr};

    tracewatch::CliArgs args(1, argv);
    QVERIFY(args.debugTrace());
    qunsetenv("TRACEWATCH_DEBUG_TRACE");
}

QTEST_MAIN(CliArgsTests)
#include "test_cli_args.moc"

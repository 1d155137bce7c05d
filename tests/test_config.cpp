#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testDefaultsWhenMissing();
    void testSectionsParsed();
    void testOutOfRangeValuesClamped();
    void testMalformedFileFallsBack();
    void testEnvironmentOverridesFile();
    void testConfigPathFollowsHome();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::filesystem::path writeConfig(const std::string &content) const;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::init()
{
    qunsetenv("TRACEWATCH_CONFIG");
    qunsetenv("XDG_CONFIG_HOME");
    qunsetenv("TRACEWATCH_AI_PROVIDER");
    qunsetenv("TRACEWATCH_AI_KEY");
    qunsetenv("TRACEWATCH_AI_MODEL");
}

std::filesystem::path ConfigTests::writeConfig(const std::string &content) const
{
    const auto path = std::filesystem::path(m_tempDir.path().toStdString()) / "config.json";
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

void ConfigTests::testDefaultsWhenMissing()
{
    const auto config = tracewatch::loadConfig(
        std::filesystem::path(m_tempDir.path().toStdString()) / "missing.json");

    QCOMPARE(config.tracker.pollIntervalMs, 1000);
    QCOMPARE(config.tracker.minDurationSeconds, 2.0);
    QCOMPARE(config.sampler.intervalMs, 30000);
    QCOMPARE(config.sampler.topN, 50);
    QVERIFY(config.browserSync.enabled);
    QCOMPARE(config.ai.provider, std::string("gemini"));
    QVERIFY(!config.ai.isConfigured());
    QVERIFY(config.rules.productiveProcesses.empty());
}

void ConfigTests::testSectionsParsed()
{
    const auto path = writeConfig(R"({
        "ai": {"provider": "claude", "apiKey": "k-123", "model": "some-model"},
        "tracker": {"pollIntervalMs": 500, "minDurationSeconds": 5},
        "sampler": {"topN": 20},
        "browserSync": {"enabled": false},
        "rules": {
            "productiveProcesses": ["blender"],
            "distractionKeywords": ["reddit", 42]
        }
    })");

    const auto config = tracewatch::loadConfig(path);
    QCOMPARE(config.ai.provider, std::string("claude"));
    QVERIFY(config.ai.isConfigured());
    QCOMPARE(config.ai.model, std::string("some-model"));
    QCOMPARE(config.tracker.pollIntervalMs, 500);
    QCOMPARE(config.tracker.minDurationSeconds, 5.0);
    QCOMPARE(config.sampler.topN, 20);
    QCOMPARE(config.sampler.intervalMs, 30000);
    QVERIFY(!config.browserSync.enabled);
    QCOMPARE(config.rules.productiveProcesses.size(), size_t(1));
    QCOMPARE(config.rules.productiveProcesses.front(), std::string("blender"));
    // Non-string entries are skipped.
    QCOMPARE(config.rules.distractionKeywords.size(), size_t(1));
}

void ConfigTests::testOutOfRangeValuesClamped()
{
    const auto config = tracewatch::configFromJson(nlohmann::json{
        {"tracker", {{"pollIntervalMs", 1}, {"resourceRefreshProbability", 4.0}}},
        {"sampler", {{"topN", 0}}}
    });

    QCOMPARE(config.tracker.pollIntervalMs, 100);
    QCOMPARE(config.tracker.resourceRefreshProbability, 1.0);
    QCOMPARE(config.sampler.topN, 1);
}

void ConfigTests::testMalformedFileFallsBack()
{
    const auto path = writeConfig("{ \"tracker\": { \"pollIntervalMs\": ");
    const auto config = tracewatch::loadConfig(path);
    QCOMPARE(config.tracker.pollIntervalMs, 1000);

    const auto wrongType = writeConfig(R"({"tracker": {"pollIntervalMs": "fast"}})");
    const auto fallback = tracewatch::loadConfig(wrongType);
    QCOMPARE(fallback.tracker.pollIntervalMs, 1000);
}

void ConfigTests::testEnvironmentOverridesFile()
{
    const auto path = writeConfig(R"({"ai": {"provider": "gemini", "apiKey": "from-file"}})");
    qputenv("TRACEWATCH_AI_PROVIDER", "openai");
    qputenv("TRACEWATCH_AI_KEY", "from-env");

    const auto config = tracewatch::loadConfig(path);
    QCOMPARE(config.ai.provider, std::string("openai"));
    QCOMPARE(config.ai.apiKey, std::string("from-env"));
}

void ConfigTests::testConfigPathFollowsHome()
{
    const auto expected = std::filesystem::path(m_tempDir.path().toStdString())
        / ".config" / "tracewatch" / "config.json";
    QCOMPARE(QString::fromStdString(tracewatch::configFilePath().string()),
             QString::fromStdString(expected.string()));

    qputenv("TRACEWATCH_CONFIG", "/tmp/elsewhere.json");
    QCOMPARE(QString::fromStdString(tracewatch::configFilePath().string()),
             QStringLiteral("/tmp/elsewhere.json"));
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"

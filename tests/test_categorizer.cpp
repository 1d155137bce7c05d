#include <QtTest/QtTest>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "daemon/categorizer.hpp"

using tracewatch::ActivityCategory;
using tracewatch::Categorizer;

class CategorizerTests : public QObject
{
    Q_OBJECT
private slots:
    void testKnownProcesses();
    void testWindowsSpellingsNormalize();
    void testBrowserTitles();
    void testUserProcessRulesWin();
    void testUserKeywords();
    void testUnknownIsOther();
};

void CategorizerTests::testKnownProcesses()
{
    Categorizer categorizer;
    QCOMPARE(categorizer.categorize("code", "main.cpp - tracewatch"), ActivityCategory::Development);
    QCOMPARE(categorizer.categorize("nvim", "notes"), ActivityCategory::Development);
    QCOMPARE(categorizer.categorize("slack", "general"), ActivityCategory::Communication);
    QCOMPARE(categorizer.categorize("obsidian", "vault"), ActivityCategory::Productivity);
    QCOMPARE(categorizer.categorize("spotify", "Daily Mix"), ActivityCategory::Distraction);
}

void CategorizerTests::testWindowsSpellingsNormalize()
{
    QCOMPARE(Categorizer::normalizeProcessName("  Code.EXE "), std::string("code"));
    QCOMPARE(Categorizer::normalizeProcessName("   "), std::string());

    Categorizer categorizer;
    QCOMPARE(categorizer.categorize("Code.exe", "x"), ActivityCategory::Development);
    QCOMPARE(categorizer.categorize("chrome.exe", "New Tab"), ActivityCategory::Browsing);
    QVERIFY(Categorizer::isBrowser("Firefox"));
    QVERIFY(!Categorizer::isBrowser("slack"));
}

void CategorizerTests::testBrowserTitles()
{
    Categorizer categorizer;
    QCOMPARE(categorizer.categorize("firefox", "c++ - Stack Overflow"), ActivityCategory::Research);
    QCOMPARE(categorizer.categorize("chrome", "std::vector - cppreference.com"),
             ActivityCategory::Research);
    QCOMPARE(categorizer.categorize("chrome", "Funny cats - YouTube"), ActivityCategory::Distraction);
    QCOMPARE(categorizer.categorize("brave", "r/cpp - Reddit"), ActivityCategory::Distraction);
    QCOMPARE(categorizer.categorize("firefox", "Weather forecast"), ActivityCategory::Browsing);
}

void CategorizerTests::testUserProcessRulesWin()
{
    tracewatch::UserRules rules;
    rules.productiveProcesses = {"Spotify.exe"};
    rules.distractionProcesses = {"code"};
    Categorizer categorizer(rules);

    QCOMPARE(categorizer.categorize("spotify", "Focus playlist"), ActivityCategory::Productivity);
    QCOMPARE(categorizer.categorize("code", "main.cpp"), ActivityCategory::Distraction);
}

void CategorizerTests::testUserKeywords()
{
    tracewatch::UserRules rules;
    rules.productiveKeywords = {"Lecture"};
    rules.distractionKeywords = {"shopping"};
    Categorizer categorizer(rules);

    QCOMPARE(categorizer.categorize("firefox", "Linear algebra lecture 4"), ActivityCategory::Research);
    QCOMPARE(categorizer.categorize("firefox", "Shopping cart"), ActivityCategory::Distraction);
    // Keywords also apply to unknown processes.
    QCOMPARE(categorizer.categorize("someviewer", "Lecture slides"), ActivityCategory::Productivity);
}

void CategorizerTests::testUnknownIsOther()
{
    Categorizer categorizer;
    QCOMPARE(categorizer.categorize("mystery-app", "Untitled"), ActivityCategory::Other);
    QCOMPARE(tracewatch::toCategoryString(categorizer.categorize("", "")), std::string("Other"));
}

QTEST_MAIN(CategorizerTests)
#include "test_categorizer.moc"

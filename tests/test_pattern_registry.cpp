#include <QtTest/QtTest>
#include <atomic>
#include <thread>
#include <vector>

#include "utils/TestUtils.hpp"
#include "../src/core/security/PatternRegistry.hpp"

using namespace RepoGuard;
using namespace RepoGuard::Test;

class TestPatternRegistry : public QObject {
    Q_OBJECT

private slots:
    void testAllPatternsCompile() {
        const PatternRegistry& registry = PatternRegistry::instance();
        QVERIFY(registry.sqlInjection().isValid());
        QVERIFY(registry.scriptInjection().isValid());
        QVERIFY(registry.repositoryName().isValid());
        QVERIFY(registry.fieldName().isValid());
        QVERIFY(registry.serverAddress().isValid());
    }

    void testSingleInstance() {
        QCOMPARE(&PatternRegistry::instance(), &PatternRegistry::instance());
    }

    void testSqlInjectionPatterns_data() {
        QTest::addColumn<QString>("input");
        QTest::addColumn<bool>("matches");

        QTest::newRow("select") << "SELECT * FROM users" << true;
        QTest::newRow("drop with comment") << "'; DROP TABLE users--" << true;
        QTest::newRow("tautology") << "1' OR '1'='1" << true;
        QTest::newRow("union") << "UNION SELECT password" << true;
        QTest::newRow("insert") << "INSERT INTO table" << true;
        QTest::newRow("lowercase keyword") << "delete from x" << true;
        QTest::newRow("semicolon") << "a;b" << true;
        QTest::newRow("plain text") << "normal text" << false;
        QTest::newRow("hostname") << "api.example.com" << false;
    }

    void testSqlInjectionPatterns() {
        QFETCH(QString, input);
        QFETCH(bool, matches);
        QCOMPARE(PatternRegistry::instance().matchesSqlInjection(input), matches);
    }

    void testSqlControlCharacters() {
        const PatternRegistry& registry = PatternRegistry::instance();
        QVERIFY(registry.matchesSqlInjection(TestUtils::withControlCharacter("a", 0x00, "b")));
        QVERIFY(registry.matchesSqlInjection(TestUtils::withControlCharacter("a", 0x0a, "b")));
        QVERIFY(registry.matchesSqlInjection(TestUtils::withControlCharacter("a", 0x0d, "b")));
        QVERIFY(registry.matchesSqlInjection(TestUtils::withControlCharacter("a", 0x1a, "b")));
        QVERIFY(!registry.matchesSqlInjection(TestUtils::withControlCharacter("a", 0x09, "b")));
    }

    void testScriptInjectionPatterns_data() {
        QTest::addColumn<QString>("input");
        QTest::addColumn<bool>("matches");

        QTest::newRow("script tag") << "<script>alert('xss')</script>" << true;
        QTest::newRow("uppercase script tag") << "<SCRIPT src=x>" << true;
        QTest::newRow("javascript scheme") << "javascript:void(0)" << true;
        QTest::newRow("event handler") << "onclick='alert()'" << true;
        QTest::newRow("spaced handler") << "onload = run" << true;
        QTest::newRow("eval") << "eval(code)" << true;
        QTest::newRow("document") << "document.cookie" << true;
        QTest::newRow("window") << "window.location" << true;
        QTest::newRow("accented handler name") << QString(QString("onclick") + QChar(0x00e9) + "=x") << true;
        QTest::newRow("no-break space before assignment")
            << QString(QString("onload") + QChar(0x00a0) + "=x") << true;
        QTest::newRow("plain text") << "normal text" << false;
        QTest::newRow("online without assignment") << "online meeting" << false;
    }

    void testScriptInjectionPatterns() {
        QFETCH(QString, input);
        QFETCH(bool, matches);
        QCOMPARE(PatternRegistry::instance().matchesScriptInjection(input), matches);
    }

    void testShapeMatchersAreAnchored() {
        const PatternRegistry& registry = PatternRegistry::instance();
        QVERIFY(registry.repositoryName().match("repo-1").hasMatch());
        QVERIFY(!registry.repositoryName().match("repo 1").hasMatch());
        QVERIFY(!registry.repositoryName().match("_repo").hasMatch());
        QVERIFY(registry.fieldName().match("Field Name").hasMatch());
        QVERIFY(!registry.fieldName().match("1Field").hasMatch());
        QVERIFY(registry.fieldName().match(QString("Field") + QChar(0x00a0) + "Name").hasMatch());
        QVERIFY(!registry.serverAddress().match("host.").hasMatch());
    }

    void testConcurrentUse() {
        std::atomic<int> mismatches{0};
        std::vector<std::thread> workers;

        for (int i = 0; i < 8; ++i) {
            workers.emplace_back([&mismatches]() {
                for (int j = 0; j < 200; ++j) {
                    const PatternRegistry& registry = PatternRegistry::instance();
                    if (!registry.matchesSqlInjection("DROP TABLE x") ||
                        registry.matchesSqlInjection("harmless") ||
                        !registry.matchesScriptInjection("<script>")) {
                        ++mismatches;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        QCOMPARE(mismatches.load(), 0);
    }
};

int runTestPatternRegistry(int argc, char** argv) {
    TestPatternRegistry test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_pattern_registry.moc"

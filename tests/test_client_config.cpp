#include <QtTest/QtTest>

#include "utils/TestUtils.hpp"
#include "../src/core/client/ClientConfig.hpp"

using namespace RepoGuard;
using namespace RepoGuard::Test;

class TestClientConfig : public QObject {
    Q_OBJECT

private slots:
    void testValidEnvironment() {
        ScopedEnvironment env;
        setValid(env);

        const auto config = ClientConfig::fromEnvironment();
        QVERIFY(config.hasValue());
        QCOMPARE(config.value().apiAddress, QString("api.laserfiche.com"));
        QCOMPARE(config.value().repository, QString("production-repo"));
        QCOMPARE(config.value().username, QString("john.doe"));
        QCOMPARE(config.value().password, QString("secure123!"));

        const auto endpoints = config.value().endpoints();
        QVERIFY(endpoints.hasValue());
        QCOMPARE(endpoints.value().tokenUrl(),
                 QString("https://api.laserfiche.com/LFRepositoryAPI/v1/Repositories/production-repo/Token"));
    }

    void testMissingVariable_data() {
        QTest::addColumn<QString>("variable");

        QTest::newRow("address") << ClientConfig::API_ADDRESS_VARIABLE;
        QTest::newRow("repository") << ClientConfig::REPOSITORY_VARIABLE;
        QTest::newRow("username") << ClientConfig::USERNAME_VARIABLE;
        QTest::newRow("password") << ClientConfig::PASSWORD_VARIABLE;
    }

    void testMissingVariable() {
        QFETCH(QString, variable);

        ScopedEnvironment env;
        setValid(env);
        const QByteArray name = variable.toLatin1();
        env.unset(name.constData());

        const auto config = ClientConfig::fromEnvironment();
        QVERIFY(config.hasError());
        QVERIFY(config.error().kind == ConfigErrorKind::MissingVariable);
        QCOMPARE(config.error().variable, variable);
        QVERIFY(config.error().message.contains(variable));
    }

    void testPlaceholderValues_data() {
        QTest::addColumn<QString>("variable");
        QTest::addColumn<QString>("value");

        QTest::newRow("sample server") << ClientConfig::API_ADDRESS_VARIABLE << "your-server.laserfiche.com";
        QTest::newRow("example host") << ClientConfig::API_ADDRESS_VARIABLE << "lf.example.org";
        QTest::newRow("sample repository") << ClientConfig::REPOSITORY_VARIABLE << "your-repository";
        QTest::newRow("default repository") << ClientConfig::REPOSITORY_VARIABLE << "Default";
        QTest::newRow("sample username") << ClientConfig::USERNAME_VARIABLE << "username";
        QTest::newRow("test username") << ClientConfig::USERNAME_VARIABLE << "test";
        QTest::newRow("empty username") << ClientConfig::USERNAME_VARIABLE << "";
        QTest::newRow("placeholder password") << ClientConfig::PASSWORD_VARIABLE << "my-placeholder-pw";
    }

    void testPlaceholderValues() {
        QFETCH(QString, variable);
        QFETCH(QString, value);

        ScopedEnvironment env;
        setValid(env);
        const QByteArray name = variable.toLatin1();
        env.set(name.constData(), value.toUtf8());

        const auto config = ClientConfig::fromEnvironment();
        QVERIFY(config.hasError());
        QVERIFY(config.error().kind == ConfigErrorKind::PlaceholderValue);
        QCOMPARE(config.error().variable, variable);
    }

    void testPasswordNeverShown() {
        ScopedEnvironment env;
        setValid(env);
        env.set(ClientConfig::PASSWORD_VARIABLE, "password");

        const auto config = ClientConfig::fromEnvironment();
        QVERIFY(config.hasError());
        QVERIFY(config.error().kind == ConfigErrorKind::PlaceholderValue);
        QVERIFY(config.error().message.contains("<hidden>"));
        QVERIFY(!config.error().message.contains("'password'"));
    }

    void testInvalidValues() {
        {
            ScopedEnvironment env;
            setValid(env);
            env.set(ClientConfig::API_ADDRESS_VARIABLE, "bad host name");

            const auto config = ClientConfig::fromEnvironment();
            QVERIFY(config.hasError());
            QVERIFY(config.error().kind == ConfigErrorKind::InvalidValue);
            QCOMPARE(config.error().variable, QString(ClientConfig::API_ADDRESS_VARIABLE));
            QVERIFY(config.error().message.startsWith("Invalid configuration value for LF_API_ADDRESS"));
        }
        {
            ScopedEnvironment env;
            setValid(env);
            env.set(ClientConfig::REPOSITORY_VARIABLE, "repo name");

            const auto config = ClientConfig::fromEnvironment();
            QVERIFY(config.hasError());
            QVERIFY(config.error().kind == ConfigErrorKind::InvalidValue);
            QCOMPARE(config.error().variable, QString(ClientConfig::REPOSITORY_VARIABLE));
        }
    }

    void testCheckNotPlaceholder() {
        QVERIFY(ClientConfig::checkNotPlaceholder("prod.lf.internal", "LF_API_ADDRESS").hasValue());
        QVERIFY(ClientConfig::checkNotPlaceholder("  Example  ", "LF_REPOSITORY").hasError());
        QVERIFY(ClientConfig::checkNotPlaceholder("YOUR-repo", "LF_REPOSITORY").hasError());
    }

    void testEnvironmentIsRestored() {
        const bool wasSet = qEnvironmentVariableIsSet(ClientConfig::USERNAME_VARIABLE);
        const QString before = qEnvironmentVariable(ClientConfig::USERNAME_VARIABLE);
        {
            ScopedEnvironment env;
            env.set(ClientConfig::USERNAME_VARIABLE, "someone.else");
            QCOMPARE(qEnvironmentVariable(ClientConfig::USERNAME_VARIABLE), QString("someone.else"));
        }
        QCOMPARE(qEnvironmentVariableIsSet(ClientConfig::USERNAME_VARIABLE), wasSet);
        QCOMPARE(qEnvironmentVariable(ClientConfig::USERNAME_VARIABLE), before);
    }

private:
    static void setValid(ScopedEnvironment& env) {
        env.set(ClientConfig::API_ADDRESS_VARIABLE, "api.laserfiche.com");
        env.set(ClientConfig::REPOSITORY_VARIABLE, "production-repo");
        env.set(ClientConfig::USERNAME_VARIABLE, "john.doe");
        env.set(ClientConfig::PASSWORD_VARIABLE, "secure123!");
    }
};

int runTestClientConfig(int argc, char** argv) {
    TestClientConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_client_config.moc"

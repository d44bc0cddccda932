#include "ClientConfig.hpp"
#include "../security/InputValidator.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QStringList>
#include <QtCore/QtGlobal>

namespace RepoGuard {

namespace {

const QStringList& placeholderValues() {
    static const QStringList values = {
        "your-server.laserfiche.com",
        "your-repository",
        "username",
        "password",
        "placeholder",
        "default",
        "example",
        "test",
        ""
    };
    return values;
}

// Secrets never appear in messages or logs
QString shownValue(const QString& value, const QString& variable) {
    if (variable == QLatin1String(ClientConfig::PASSWORD_VARIABLE)) {
        return QStringLiteral("<hidden>");
    }
    return value;
}

} // namespace

Expected<void, ConfigError> ClientConfig::checkNotPlaceholder(const QString& value,
                                                              const QString& variable) {
    const QString normalized = value.trimmed().toLower();

    if (placeholderValues().contains(normalized)) {
        return ConfigError(ConfigErrorKind::PlaceholderValue, variable,
                           QString("%1 contains a placeholder or default value: '%2'")
                               .arg(variable, shownValue(value, variable)));
    }

    if (normalized.contains(QLatin1String("your-")) ||
        normalized.contains(QLatin1String("example")) ||
        normalized.contains(QLatin1String("placeholder"))) {
        return ConfigError(ConfigErrorKind::PlaceholderValue, variable,
                           QString("%1 appears to contain a placeholder value: '%2'")
                               .arg(variable, shownValue(value, variable)));
    }

    return {};
}

Expected<ClientConfig, ConfigError> ClientConfig::fromEnvironment() {
    const QStringList variables = {
        API_ADDRESS_VARIABLE, REPOSITORY_VARIABLE, USERNAME_VARIABLE, PASSWORD_VARIABLE
    };

    QStringList values;
    for (const QString& variable : variables) {
        if (!qEnvironmentVariableIsSet(variable.toLatin1().constData())) {
            REPOGUARD_WARN("Required environment variable {} is not set", variable.toStdString());
            return ConfigError(ConfigErrorKind::MissingVariable, variable,
                               QString("Required environment variable '%1' is not set").arg(variable));
        }
        values.append(qEnvironmentVariable(variable.toLatin1().constData()));
    }

    for (int i = 0; i < variables.size(); ++i) {
        const auto checked = checkNotPlaceholder(values.at(i), variables.at(i));
        if (!checked) {
            REPOGUARD_WARN("{}", checked.error().message.toStdString());
            return checked.error();
        }
    }

    ClientConfig config;
    config.apiAddress = values.at(0).trimmed();
    config.repository = values.at(1).trimmed();
    config.username = values.at(2);
    config.password = values.at(3);

    const auto address = InputValidator::validateServerAddress(config.apiAddress);
    if (!address) {
        return ConfigError(ConfigErrorKind::InvalidValue, API_ADDRESS_VARIABLE,
                           QString("Invalid configuration value for %1: %2")
                               .arg(QLatin1String(API_ADDRESS_VARIABLE), address.error().message()));
    }

    const auto repository = InputValidator::validateRepositoryName(config.repository);
    if (!repository) {
        return ConfigError(ConfigErrorKind::InvalidValue, REPOSITORY_VARIABLE,
                           QString("Invalid configuration value for %1: %2")
                               .arg(QLatin1String(REPOSITORY_VARIABLE), repository.error().message()));
    }

    REPOGUARD_INFO("Client configured for {} / {} as {}",
                   config.apiAddress.toStdString(), config.repository.toStdString(),
                   config.username.toStdString());
    return config;
}

Expected<EndpointBuilder, ValidationError> ClientConfig::endpoints() const {
    return EndpointBuilder::create(apiAddress, repository);
}

} // namespace RepoGuard

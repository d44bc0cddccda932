#pragma once

#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "../security/ValidationError.hpp"
#include "EndpointBuilder.hpp"

namespace RepoGuard {

enum class ConfigErrorKind {
    MissingVariable,
    PlaceholderValue,
    InvalidValue
};

struct ConfigError {
    ConfigError(ConfigErrorKind kind, const QString& variable, const QString& message)
        : kind(kind), variable(variable), message(message) {}

    ConfigErrorKind kind;
    QString variable;
    QString message;
};

// Connection settings for the repository API, read from LF_* environment variables
struct ClientConfig {
    static constexpr const char* API_ADDRESS_VARIABLE = "LF_API_ADDRESS";
    static constexpr const char* REPOSITORY_VARIABLE = "LF_REPOSITORY";
    static constexpr const char* USERNAME_VARIABLE = "LF_USERNAME";
    static constexpr const char* PASSWORD_VARIABLE = "LF_PASSWORD";

    QString apiAddress;
    QString repository;
    QString username;
    QString password;

    static Expected<ClientConfig, ConfigError> fromEnvironment();

    // Rejects values left over from sample configurations ("your-server...", "example", ...)
    static Expected<void, ConfigError> checkNotPlaceholder(const QString& value,
                                                           const QString& variable);

    Expected<EndpointBuilder, ValidationError> endpoints() const;
};

} // namespace RepoGuard

#pragma once

#include <QtCore/QString>
#include <QtCore/QJsonValue>
#include <QtCore/QtGlobal>
#include <limits>
#include "../common/Expected.hpp"
#include "ValidationError.hpp"
#include "TargetPlatform.hpp"

namespace RepoGuard {

/**
 * @brief Validation and sanitization of every value a repository request is built from
 *
 * Each call takes one untrusted value and returns either the validated (or
 * sanitized) value or the first rule it broke. Nothing here touches the network;
 * validateFilePath() is the only call that reads the filesystem.
 */
class InputValidator {
public:
    static constexpr qint64 MAX_ENTRY_ID = std::numeric_limits<qint64>::max() / 2;
    static constexpr quint64 MAX_FILE_SIZE = 100ULL * 1024 * 1024; // 100MB
    static constexpr int MAX_FIELD_VALUE_LENGTH = 10 * 1024;      // bytes of UTF-8
    static constexpr int MAX_REPOSITORY_NAME_LENGTH = 64;
    static constexpr int MAX_FIELD_NAME_LENGTH = 128;
    static constexpr int MAX_SERVER_ADDRESS_LENGTH = 253;
    static constexpr int MAX_LABEL_LENGTH = 63;
    static constexpr int MAX_FILE_NAME_LENGTH = 255;

    // Identifiers and sizes
    static Expected<qint64, ValidationError> validateEntryId(qint64 id);
    static Expected<quint64, ValidationError> validateFileSize(quint64 size);

    // Returns the canonical absolute path. A path that does not exist yet is
    // accepted when its parent directory exists (new import/export targets).
    static Expected<QString, ValidationError> validateFilePath(const QString& path);
    static Expected<QString, ValidationError> validateFileName(const QString& name,
                                                               TargetPlatform platform = hostPlatform());

    // Server identity
    static Expected<QString, ValidationError> validateRepositoryName(const QString& name);
    static Expected<QString, ValidationError> validateServerAddress(const QString& address);
    static Expected<QString, ValidationError> validateApiUrl(const QString& url);

    // Metadata
    static Expected<QString, ValidationError> validateFieldName(const QString& name);
    static Expected<QString, ValidationError> validateFieldValue(const QString& value);
    static Expected<QJsonValue, ValidationError> validateMetadataJson(const QJsonValue& metadata);

    static bool containsSqlInjection(const QString& input);
    static bool containsScriptInjection(const QString& input);

private:
    static ValidationError reject(ValidationErrorKind kind, const QString& value);
    static ValidationError reject(const ValidationError& error);
    static QString escapeFieldValue(const QString& value);
    static bool isReservedWindowsName(const QString& name);
};

} // namespace RepoGuard

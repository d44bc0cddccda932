#include "InputValidator.hpp"
#include "PatternRegistry.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QStringList>
#include <QtCore/QUrl>

namespace RepoGuard {

namespace {

// Length limits are counted in bytes of the UTF-8 encoding sent over the wire
int utf8Length(const QString& value) {
    return static_cast<int>(value.toUtf8().size());
}

const QStringList& reservedWindowsNames() {
    static const QStringList names = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
    };
    return names;
}

const QString WINDOWS_INVALID_CHARACTERS = QStringLiteral("<>:\"|?*");

} // namespace

ValidationError InputValidator::reject(ValidationErrorKind kind, const QString& value) {
    return reject(ValidationError(kind, value));
}

ValidationError InputValidator::reject(const ValidationError& error) {
    REPOGUARD_WARN("Input rejected ({}): {}",
                   validationErrorKindToString(error.kind()).toStdString(),
                   error.message().toStdString());
    return error;
}

bool InputValidator::containsSqlInjection(const QString& input) {
    return PatternRegistry::instance().matchesSqlInjection(input);
}

bool InputValidator::containsScriptInjection(const QString& input) {
    return PatternRegistry::instance().matchesScriptInjection(input);
}

Expected<qint64, ValidationError> InputValidator::validateEntryId(qint64 id) {
    // Upper half of the qint64 range is reserved
    if (id <= 0 || id > MAX_ENTRY_ID) {
        return reject(ValidationErrorKind::InvalidEntryId, QString::number(id));
    }
    return id;
}

Expected<quint64, ValidationError> InputValidator::validateFileSize(quint64 size) {
    if (size > MAX_FILE_SIZE) {
        return reject(ValidationError::fileSizeTooLarge(size, MAX_FILE_SIZE));
    }
    return size;
}

Expected<QString, ValidationError> InputValidator::validateFilePath(const QString& path) {
    if (path.isEmpty() || path.contains(QChar(0))) {
        return reject(ValidationErrorKind::InvalidFilePath, path);
    }

    // Rejected before any resolution, whether or not the path exists
    if (path.contains(QLatin1String("..")) || path.contains(QLatin1Char('~'))) {
        return reject(ValidationErrorKind::PathTraversalAttempt, path);
    }

    const QFileInfo info(path);

    if (info.exists()) {
        const QString canonical = info.canonicalFilePath();
        if (canonical.isEmpty()) {
            return reject(ValidationErrorKind::InvalidFilePath, path);
        }
        // Symlinks may resolve anywhere; the resolved form must still be clean
        if (canonical.split(QLatin1Char('/')).contains(QLatin1String(".."))) {
            return reject(ValidationErrorKind::PathTraversalAttempt, path);
        }
        return canonical;
    }

    // A dangling symlink would redirect the eventual write
    if (info.isSymLink() || info.fileName().isEmpty()) {
        return reject(ValidationErrorKind::InvalidFilePath, path);
    }

    const QFileInfo parent(info.absolutePath());
    if (!parent.exists() || !parent.isDir()) {
        return reject(ValidationErrorKind::InvalidFilePath, path);
    }

    const QString canonicalParent = parent.canonicalFilePath();
    if (canonicalParent.isEmpty()) {
        return reject(ValidationErrorKind::InvalidFilePath, path);
    }

    REPOGUARD_TRACE("Accepting new file {} under {}",
                    info.fileName().toStdString(), canonicalParent.toStdString());
    return QDir(canonicalParent).filePath(info.fileName());
}

Expected<QString, ValidationError> InputValidator::validateFileName(const QString& name,
                                                                    TargetPlatform platform) {
    if (name.isEmpty() || utf8Length(name) > MAX_FILE_NAME_LENGTH) {
        return reject(ValidationErrorKind::InvalidFileName, name);
    }

    if (name.contains(QChar(0))) {
        return reject(ValidationErrorKind::InvalidFileName, name);
    }

    if (name.contains(QLatin1String("..")) || name.contains(QLatin1Char('/')) ||
        name.contains(QLatin1Char('\\'))) {
        return reject(ValidationErrorKind::InvalidFileName, name);
    }

    if (platform == TargetPlatform::Windows) {
        for (const QChar c : name) {
            if (c.unicode() < 0x20 || WINDOWS_INVALID_CHARACTERS.contains(c)) {
                return reject(ValidationErrorKind::InvalidFileName, name);
            }
        }

        if (isReservedWindowsName(name)) {
            return reject(ValidationErrorKind::InvalidFileName, name);
        }
    }

    return name;
}

bool InputValidator::isReservedWindowsName(const QString& name) {
    const QString upperName = name.toUpper();
    for (const QString& reserved : reservedWindowsNames()) {
        if (upperName == reserved || upperName.startsWith(reserved + QLatin1Char('.'))) {
            return true;
        }
    }
    return false;
}

Expected<QString, ValidationError> InputValidator::validateRepositoryName(const QString& name) {
    if (name.isEmpty() || utf8Length(name) > MAX_REPOSITORY_NAME_LENGTH) {
        return reject(ValidationErrorKind::InvalidRepositoryName, name);
    }

    const PatternRegistry& patterns = PatternRegistry::instance();

    if (patterns.matchesSqlInjection(name)) {
        return reject(ValidationErrorKind::SqlInjectionAttempt, name);
    }

    if (!patterns.repositoryName().match(name).hasMatch()) {
        return reject(ValidationErrorKind::InvalidRepositoryName, name);
    }

    return name;
}

Expected<QString, ValidationError> InputValidator::validateServerAddress(const QString& address) {
    if (address.isEmpty() || utf8Length(address) > MAX_SERVER_ADDRESS_LENGTH) {
        return reject(ValidationErrorKind::InvalidUrl, address);
    }

    const PatternRegistry& patterns = PatternRegistry::instance();

    if (patterns.matchesSqlInjection(address)) {
        return reject(ValidationErrorKind::SqlInjectionAttempt, address);
    }

    if (!patterns.serverAddress().match(address).hasMatch()) {
        return reject(ValidationErrorKind::InvalidUrl, address);
    }

    const QStringList labels = address.split(QLatin1Char('.'));
    for (const QString& label : labels) {
        if (label.isEmpty() || label.size() > MAX_LABEL_LENGTH) {
            return reject(ValidationErrorKind::InvalidUrl, address);
        }
        if (label.startsWith(QLatin1Char('-')) || label.endsWith(QLatin1Char('-'))) {
            return reject(ValidationErrorKind::InvalidUrl, address);
        }
    }

    return address;
}

Expected<QString, ValidationError> InputValidator::validateApiUrl(const QString& url) {
    if (url.isEmpty()) {
        return reject(ValidationErrorKind::InvalidUrl, url);
    }

    // A relative reference parses, but is not a usable endpoint
    const QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative()) {
        return reject(ValidationErrorKind::InvalidUrl, url);
    }

    if (parsed.scheme().compare(QLatin1String("https"), Qt::CaseInsensitive) != 0) {
        return reject(ValidationErrorKind::InsecureUrl, url);
    }

    if (parsed.host().isEmpty()) {
        return reject(ValidationErrorKind::InvalidUrl, url);
    }

    if (containsSqlInjection(url)) {
        return reject(ValidationErrorKind::SqlInjectionAttempt, url);
    }

    return url;
}

Expected<QString, ValidationError> InputValidator::validateFieldName(const QString& name) {
    if (name.isEmpty() || utf8Length(name) > MAX_FIELD_NAME_LENGTH) {
        return reject(ValidationErrorKind::InvalidFieldName, name);
    }

    const PatternRegistry& patterns = PatternRegistry::instance();

    if (patterns.matchesSqlInjection(name)) {
        return reject(ValidationErrorKind::SqlInjectionAttempt, name);
    }

    if (patterns.matchesScriptInjection(name)) {
        return reject(ValidationErrorKind::ScriptInjectionAttempt, name);
    }

    if (!patterns.fieldName().match(name).hasMatch()) {
        return reject(ValidationErrorKind::InvalidFieldName, name);
    }

    return name;
}

Expected<QString, ValidationError> InputValidator::validateFieldValue(const QString& value) {
    const int length = utf8Length(value);
    if (length > MAX_FIELD_VALUE_LENGTH) {
        return reject(ValidationError::fieldValueTooLong(length, MAX_FIELD_VALUE_LENGTH));
    }

    // SQL-looking text is legitimate in a value and gets escaped; script does not
    if (containsScriptInjection(value)) {
        return reject(ValidationErrorKind::ScriptInjectionAttempt, value);
    }

    return escapeFieldValue(value);
}

// Strips NUL and SUB, then doubles single quotes and backslashes. A pair that is
// already doubled is kept as-is, so feeding the output back in returns it unchanged.
QString InputValidator::escapeFieldValue(const QString& value) {
    QString stripped = value;
    stripped.remove(QChar(0));
    stripped.remove(QChar(0x1a));

    QString escaped;
    escaped.reserve(stripped.size() + stripped.size() / 8);

    for (qsizetype i = 0; i < stripped.size(); ++i) {
        const QChar c = stripped.at(i);
        if (c == QLatin1Char('\'') || c == QLatin1Char('\\')) {
            escaped += c;
            escaped += c;
            if (i + 1 < stripped.size() && stripped.at(i + 1) == c) {
                ++i;
            }
            continue;
        }
        escaped += c;
    }

    return escaped;
}

Expected<QJsonValue, ValidationError> InputValidator::validateMetadataJson(const QJsonValue& metadata) {
    if (!metadata.isObject()) {
        return metadata;
    }

    const QJsonObject fields = metadata.toObject();
    QJsonObject validated;

    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        const auto key = validateFieldName(it.key());
        if (!key) {
            return key.error();
        }

        const QJsonValue value = it.value();

        if (value.isString()) {
            const auto sanitized = validateFieldValue(value.toString());
            if (!sanitized) {
                return sanitized.error();
            }
            validated.insert(key.value(), sanitized.value());
        } else if (value.isArray()) {
            QJsonArray items;
            for (const QJsonValue& item : value.toArray()) {
                if (!item.isString()) {
                    items.append(item);
                    continue;
                }
                const auto sanitized = validateFieldValue(item.toString());
                if (!sanitized) {
                    return sanitized.error();
                }
                items.append(sanitized.value());
            }
            validated.insert(key.value(), items);
        } else {
            // Nested objects are copied as-is; only the first level is validated
            validated.insert(key.value(), value);
        }
    }

    return QJsonValue(validated);
}

} // namespace RepoGuard

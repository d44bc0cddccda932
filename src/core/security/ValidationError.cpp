#include "ValidationError.hpp"

namespace RepoGuard {

namespace {

constexpr int MAX_DISPLAY_LENGTH = 256;

// Control characters would let a hostile value forge extra log or terminal lines
QString displayable(const QString& value) {
    QString shown;
    shown.reserve(qMin<qsizetype>(value.size(), MAX_DISPLAY_LENGTH) + 3);
    for (const QChar c : value) {
        if (shown.size() >= MAX_DISPLAY_LENGTH) {
            shown += QStringLiteral("...");
            break;
        }
        shown += (c.unicode() < 0x20 || c.unicode() == 0x7f) ? QChar('?') : c;
    }
    return shown;
}

} // namespace

QString validationErrorKindToString(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::InvalidEntryId: return "InvalidEntryId";
        case ValidationErrorKind::InvalidFilePath: return "InvalidFilePath";
        case ValidationErrorKind::PathTraversalAttempt: return "PathTraversalAttempt";
        case ValidationErrorKind::InvalidRepositoryName: return "InvalidRepositoryName";
        case ValidationErrorKind::InvalidUrl: return "InvalidUrl";
        case ValidationErrorKind::InsecureUrl: return "InsecureUrl";
        case ValidationErrorKind::InvalidFieldName: return "InvalidFieldName";
        case ValidationErrorKind::InvalidFieldValue: return "InvalidFieldValue";
        case ValidationErrorKind::SqlInjectionAttempt: return "SqlInjectionAttempt";
        case ValidationErrorKind::ScriptInjectionAttempt: return "ScriptInjectionAttempt";
        case ValidationErrorKind::FileSizeTooLarge: return "FileSizeTooLarge";
        case ValidationErrorKind::InvalidFileName: return "InvalidFileName";
    }
    return "Unknown";
}

ValidationError::ValidationError(ValidationErrorKind kind, const QString& value)
    : kind_(kind), value_(value) {}

ValidationError ValidationError::fileSizeTooLarge(quint64 size, quint64 limit) {
    ValidationError error(ValidationErrorKind::FileSizeTooLarge, QString::number(size));
    error.size_ = size;
    error.limit_ = limit;
    return error;
}

ValidationError ValidationError::fieldValueTooLong(quint64 length, quint64 limit) {
    ValidationError error(ValidationErrorKind::InvalidFieldValue, QString());
    error.size_ = length;
    error.limit_ = limit;
    return error;
}

QString ValidationError::message() const {
    switch (kind_) {
        case ValidationErrorKind::InvalidEntryId:
            return QString("Invalid entry ID: %1. Entry IDs must be positive integers.")
                   .arg(displayable(value_));
        case ValidationErrorKind::InvalidFilePath:
            return QString("Invalid file path: %1. Path contains invalid characters or "
                           "its parent directory does not exist.")
                   .arg(displayable(value_));
        case ValidationErrorKind::PathTraversalAttempt:
            return QString("Path traversal attempt detected in: %1").arg(displayable(value_));
        case ValidationErrorKind::InvalidRepositoryName:
            return QString("Invalid repository name: %1. Repository names must be alphanumeric "
                           "with hyphens or underscores, 1-64 characters.")
                   .arg(displayable(value_));
        case ValidationErrorKind::InvalidUrl:
            return QString("Invalid URL: %1").arg(displayable(value_));
        case ValidationErrorKind::InsecureUrl:
            return QString("Insecure URL: %1. HTTPS is required for API endpoints.")
                   .arg(displayable(value_));
        case ValidationErrorKind::InvalidFieldName:
            return QString("Invalid field name: %1. Field names must start with a letter and "
                           "contain only alphanumeric characters, underscores, hyphens, or spaces.")
                   .arg(displayable(value_));
        case ValidationErrorKind::InvalidFieldValue:
            return QString("Invalid field value: %1 bytes exceeds maximum length of %2 bytes")
                   .arg(size_).arg(limit_);
        case ValidationErrorKind::SqlInjectionAttempt:
            return "SQL injection pattern detected in input";
        case ValidationErrorKind::ScriptInjectionAttempt:
            return "Script injection pattern detected in input";
        case ValidationErrorKind::FileSizeTooLarge:
            return QString("File size %1 bytes exceeds maximum allowed size of %2 bytes")
                   .arg(size_).arg(limit_);
        case ValidationErrorKind::InvalidFileName:
            return QString("Invalid file name: %1").arg(displayable(value_));
    }
    return "Validation failed";
}

} // namespace RepoGuard

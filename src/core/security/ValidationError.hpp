#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>

namespace RepoGuard {

enum class ValidationErrorKind {
    InvalidEntryId,
    InvalidFilePath,
    PathTraversalAttempt,
    InvalidRepositoryName,
    InvalidUrl,
    InsecureUrl,
    InvalidFieldName,
    InvalidFieldValue,
    SqlInjectionAttempt,
    ScriptInjectionAttempt,
    FileSizeTooLarge,
    InvalidFileName
};

QString validationErrorKindToString(ValidationErrorKind kind);

/**
 * @brief Classified rejection of one caller-supplied value
 *
 * Carries the offending value for diagnostics. message() decides how much of it
 * is shown: injection matches and field values are never echoed back.
 */
class ValidationError {
public:
    ValidationError(ValidationErrorKind kind, const QString& value);

    static ValidationError fileSizeTooLarge(quint64 size, quint64 limit);
    static ValidationError fieldValueTooLong(quint64 length, quint64 limit);

    ValidationErrorKind kind() const { return kind_; }
    const QString& value() const { return value_; }
    quint64 size() const { return size_; }
    quint64 limit() const { return limit_; }

    QString message() const;

    bool isInjectionAttempt() const {
        return kind_ == ValidationErrorKind::SqlInjectionAttempt ||
               kind_ == ValidationErrorKind::ScriptInjectionAttempt;
    }

private:
    ValidationErrorKind kind_;
    QString value_;
    quint64 size_ = 0;
    quint64 limit_ = 0;
};

} // namespace RepoGuard

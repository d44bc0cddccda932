#pragma once

#include <QtCore/QRegularExpression>
#include <QtCore/QString>

namespace RepoGuard {

/**
 * @brief Compiled matchers shared by every validator
 *
 * Built on first use through a function-local static, so concurrent first
 * access is race-free. The registry is immutable afterwards; callers only ever
 * see a const reference.
 *
 * A pattern that fails to compile is a build defect, reported by throwing
 * std::logic_error out of instance() rather than as a per-call validation error.
 */
class PatternRegistry {
public:
    static const PatternRegistry& instance();

    PatternRegistry(const PatternRegistry&) = delete;
    PatternRegistry& operator=(const PatternRegistry&) = delete;

    // SQL statement keywords and the -- ; ' NUL LF CR SUB metacharacters, case-insensitive
    const QRegularExpression& sqlInjection() const { return sqlInjection_; }

    // <script, javascript:, on*= handlers, eval(, alert(, document., window.
    const QRegularExpression& scriptInjection() const { return scriptInjection_; }

    const QRegularExpression& repositoryName() const { return repositoryName_; }
    const QRegularExpression& fieldName() const { return fieldName_; }
    const QRegularExpression& serverAddress() const { return serverAddress_; }

    bool matchesSqlInjection(const QString& input) const;
    bool matchesScriptInjection(const QString& input) const;

private:
    PatternRegistry();

    static QRegularExpression compile(const QString& pattern,
                                      QRegularExpression::PatternOptions options =
                                          QRegularExpression::NoPatternOption);

    const QRegularExpression sqlInjection_;
    const QRegularExpression scriptInjection_;
    const QRegularExpression repositoryName_;
    const QRegularExpression fieldName_;
    const QRegularExpression serverAddress_;
};

} // namespace RepoGuard

#include "PatternRegistry.hpp"
#include "../common/Logger.hpp"
#include <stdexcept>

namespace RepoGuard {

const PatternRegistry& PatternRegistry::instance() {
    static const PatternRegistry registry;
    return registry;
}

PatternRegistry::PatternRegistry()
    : sqlInjection_(compile(
          R"((SELECT|INSERT|UPDATE|DELETE|DROP|CREATE|ALTER|EXEC|EXECUTE|UNION|--|;|'|\x00|\n|\r|\x1a))",
          QRegularExpression::CaseInsensitiveOption))
    , scriptInjection_(compile(
          R"((<script|javascript:|on\w+\s*=|eval\(|alert\(|document\.|window\.))",
          QRegularExpression::CaseInsensitiveOption |
              QRegularExpression::UseUnicodePropertiesOption))
    , repositoryName_(compile(
          QRegularExpression::anchoredPattern(R"([a-zA-Z0-9][a-zA-Z0-9\-_]{0,63})")))
    , fieldName_(compile(
          QRegularExpression::anchoredPattern(R"([a-zA-Z][a-zA-Z0-9_\-\s]{0,127})"),
          QRegularExpression::UseUnicodePropertiesOption))
    , serverAddress_(compile(
          QRegularExpression::anchoredPattern(R"([a-zA-Z0-9][a-zA-Z0-9\-\.]{0,251}[a-zA-Z0-9])"))) {
    REPOGUARD_DEBUG("Pattern registry compiled");
}

QRegularExpression PatternRegistry::compile(const QString& pattern,
                                            QRegularExpression::PatternOptions options) {
    QRegularExpression regex(pattern, options);
    if (!regex.isValid()) {
        REPOGUARD_CRITICAL("Pattern failed to compile at offset {}: {}",
                           regex.patternErrorOffset(), regex.errorString().toStdString());
        throw std::logic_error("invalid built-in pattern: " + pattern.toStdString());
    }
    // Compile now instead of on the first match from some worker thread
    regex.optimize();
    return regex;
}

bool PatternRegistry::matchesSqlInjection(const QString& input) const {
    return sqlInjection_.match(input).hasMatch();
}

bool PatternRegistry::matchesScriptInjection(const QString& input) const {
    return scriptInjection_.match(input).hasMatch();
}

} // namespace RepoGuard

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>
#include "../core/common/Expected.hpp"
#include "../core/security/TargetPlatform.hpp"

namespace RepoGuard {

// Runs a single validator over a single command-line value
class CheckCommand {
public:
    enum ExitCode {
        Valid = 0,
        Rejected = 1,
        UsageError = 2
    };

    explicit CheckCommand(TargetPlatform platform = hostPlatform());

    static QStringList kinds();

    // Strict parse of --target-platform: only posix or windows, any case.
    // The error is a usage message naming the bad value.
    static Expected<TargetPlatform, QString> parseTargetPlatform(const QString& name);

    // Writes the validated value to out, or "error: <message>" to err
    int run(const QString& kind, const QString& value, QTextStream& out, QTextStream& err) const;

private:
    int checkMetadata(const QString& json, QTextStream& out, QTextStream& err) const;

    TargetPlatform platform_;
};

} // namespace RepoGuard

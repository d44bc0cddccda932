#include "CheckCommand.hpp"
#include "../core/security/InputValidator.hpp"
#include "../core/common/Logger.hpp"
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>

namespace RepoGuard {

namespace {

template<typename T>
int report(const Expected<T, ValidationError>& result, QTextStream& out, QTextStream& err) {
    if (!result) {
        err << "error: " << result.error().message() << Qt::endl;
        return CheckCommand::Rejected;
    }
    out << result.value() << Qt::endl;
    return CheckCommand::Valid;
}

int usage(QTextStream& err, const QString& message) {
    err << "usage error: " << message << Qt::endl;
    return CheckCommand::UsageError;
}

} // namespace

CheckCommand::CheckCommand(TargetPlatform platform)
    : platform_(platform) {}

QStringList CheckCommand::kinds() {
    return {
        "entry-id", "file-size", "file-path", "file-name", "repository",
        "server", "url", "field-name", "field-value", "metadata"
    };
}

Expected<TargetPlatform, QString> CheckCommand::parseTargetPlatform(const QString& name) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == QLatin1String("posix")) {
        return TargetPlatform::Posix;
    }
    if (lowered == QLatin1String("windows")) {
        return TargetPlatform::Windows;
    }
    return QString("unknown target platform '%1' (expected posix or windows)").arg(name);
}

int CheckCommand::run(const QString& kind, const QString& value,
                      QTextStream& out, QTextStream& err) const {
    REPOGUARD_DEBUG("Checking {} value", kind.toStdString());

    if (kind == QLatin1String("entry-id")) {
        bool ok = false;
        const qint64 id = value.toLongLong(&ok);
        if (!ok) {
            return usage(err, QString("'%1' is not a 64-bit integer").arg(value));
        }
        return report(InputValidator::validateEntryId(id), out, err);
    }

    if (kind == QLatin1String("file-size")) {
        bool ok = false;
        const quint64 size = value.toULongLong(&ok);
        if (!ok) {
            return usage(err, QString("'%1' is not an unsigned 64-bit integer").arg(value));
        }
        return report(InputValidator::validateFileSize(size), out, err);
    }

    if (kind == QLatin1String("file-path")) {
        return report(InputValidator::validateFilePath(value), out, err);
    }
    if (kind == QLatin1String("file-name")) {
        return report(InputValidator::validateFileName(value, platform_), out, err);
    }
    if (kind == QLatin1String("repository")) {
        return report(InputValidator::validateRepositoryName(value), out, err);
    }
    if (kind == QLatin1String("server")) {
        return report(InputValidator::validateServerAddress(value), out, err);
    }
    if (kind == QLatin1String("url")) {
        return report(InputValidator::validateApiUrl(value), out, err);
    }
    if (kind == QLatin1String("field-name")) {
        return report(InputValidator::validateFieldName(value), out, err);
    }
    if (kind == QLatin1String("field-value")) {
        return report(InputValidator::validateFieldValue(value), out, err);
    }
    if (kind == QLatin1String("metadata")) {
        return checkMetadata(value, out, err);
    }

    return usage(err, QString("unknown kind '%1' (expected one of: %2)")
                          .arg(kind, kinds().join(", ")));
}

int CheckCommand::checkMetadata(const QString& json, QTextStream& out, QTextStream& err) const {
    // QJsonDocument only parses objects and arrays; wrapping lets a bare scalar through too
    QJsonParseError parseError;
    const QJsonDocument document =
        QJsonDocument::fromJson("[" + json.toUtf8() + "]", &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return usage(err, QString("metadata is not valid JSON: %1").arg(parseError.errorString()));
    }
    if (document.array().size() != 1) {
        return usage(err, QStringLiteral("metadata must be a single JSON value"));
    }

    const auto validated = InputValidator::validateMetadataJson(document.array().first());
    if (!validated) {
        err << "error: " << validated.error().message() << Qt::endl;
        return Rejected;
    }

    // Serialize inside a one-element array, then drop the brackets again
    const QByteArray wrapped =
        QJsonDocument(QJsonArray{validated.value()}).toJson(QJsonDocument::Compact);
    out << QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2)) << Qt::endl;
    return Valid;
}

} // namespace RepoGuard

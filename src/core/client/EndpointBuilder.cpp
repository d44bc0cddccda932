#include "EndpointBuilder.hpp"
#include "../security/InputValidator.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QUrl>

namespace RepoGuard {

EndpointBuilder::EndpointBuilder(const QString& serverAddress, const QString& repository)
    : serverAddress_(serverAddress), repository_(repository) {}

Expected<EndpointBuilder, ValidationError> EndpointBuilder::create(const QString& serverAddress,
                                                                   const QString& repository) {
    const auto address = InputValidator::validateServerAddress(serverAddress);
    if (!address) {
        return address.error();
    }

    const auto name = InputValidator::validateRepositoryName(repository);
    if (!name) {
        return name.error();
    }

    REPOGUARD_DEBUG("Endpoints bound to {} / {}",
                    address.value().toStdString(), name.value().toStdString());
    return EndpointBuilder(address.value(), name.value());
}

QString EndpointBuilder::baseUrl() const {
    return QString("https://%1/LFRepositoryAPI/v1/Repositories/%2").arg(serverAddress_, repository_);
}

QString EndpointBuilder::tokenUrl() const {
    return baseUrl() + QStringLiteral("/Token");
}

Expected<QString, ValidationError> EndpointBuilder::entryUrl(qint64 entryId) const {
    const auto id = InputValidator::validateEntryId(entryId);
    if (!id) {
        return id.error();
    }
    return QString("%1/Entries/%2").arg(baseUrl()).arg(id.value());
}

Expected<QString, ValidationError> EndpointBuilder::fieldsUrl(qint64 entryId) const {
    return entryUrl(entryId).transform([](const QString& entry) -> QString {
        return entry + QStringLiteral("/fields");
    });
}

Expected<QString, ValidationError> EndpointBuilder::fieldUrl(qint64 entryId, qint64 fieldId) const {
    return fieldsUrl(entryId).andThen(
        [fieldId](const QString& fields) -> Expected<QString, ValidationError> {
            return InputValidator::validateEntryId(fieldId).transform(
                [&fields](qint64 id) -> QString { return QString("%1/%2").arg(fields).arg(id); });
        });
}

Expected<QString, ValidationError> EndpointBuilder::documentUrl(qint64 entryId) const {
    return entryUrl(entryId).transform([](const QString& entry) -> QString {
        return entry + QStringLiteral("/Laserfiche.Repository.Document/edoc");
    });
}

Expected<QString, ValidationError> EndpointBuilder::importUrl(qint64 parentId,
                                                              const QString& fileName) const {
    const auto parent = entryUrl(parentId);
    if (!parent) {
        return parent.error();
    }

    const auto name = InputValidator::validateFileName(fileName);
    if (!name) {
        return name.error();
    }

    const QString encodedName = QString::fromLatin1(QUrl::toPercentEncoding(name.value()));
    return QString("%1/%2?autoRename=true").arg(parent.value(), encodedName);
}

} // namespace RepoGuard

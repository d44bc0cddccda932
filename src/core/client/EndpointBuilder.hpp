#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include "../common/Expected.hpp"
#include "../security/ValidationError.hpp"

namespace RepoGuard {

/**
 * @brief Builds repository REST endpoints from validated components only
 *
 * An instance exists only for a server address and repository name that passed
 * validation, and every identifier or file name spliced into a URL is validated
 * again at the call site.
 */
class EndpointBuilder {
public:
    static Expected<EndpointBuilder, ValidationError> create(const QString& serverAddress,
                                                             const QString& repository);

    // https://{address}/LFRepositoryAPI/v1/Repositories/{repository}
    QString baseUrl() const;
    QString tokenUrl() const;

    Expected<QString, ValidationError> entryUrl(qint64 entryId) const;
    Expected<QString, ValidationError> fieldsUrl(qint64 entryId) const;
    Expected<QString, ValidationError> fieldUrl(qint64 entryId, qint64 fieldId) const;
    Expected<QString, ValidationError> documentUrl(qint64 entryId) const;
    Expected<QString, ValidationError> importUrl(qint64 parentId, const QString& fileName) const;

private:
    EndpointBuilder(const QString& serverAddress, const QString& repository);

    QString serverAddress_;
    QString repository_;
};

} // namespace RepoGuard

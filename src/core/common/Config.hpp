#pragma once

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>
#include "Logger.hpp"
#include "../security/TargetPlatform.hpp"

namespace RepoGuard {

// Application settings. Validation limits are constants on InputValidator.
class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "RepoGuard",
                    const QString& applicationName = "repoguard");

    // Reads and writes an explicit INI file instead of the platform location
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const { return settings_ != nullptr; }

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;

    struct LoggingSettings {
        Logger::Level level = Logger::Level::Warn;
        QString filePath;   // empty = console only
    };

    struct ValidationSettings {
        TargetPlatform targetPlatform = hostPlatform();
    };

    LoggingSettings getLoggingSettings() const;
    ValidationSettings getValidationSettings() const;

    void setLoggingSettings(const LoggingSettings& settings);
    void setValidationSettings(const ValidationSettings& settings);

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace RepoGuard

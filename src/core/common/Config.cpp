#include "Config.hpp"

namespace RepoGuard {

namespace {

QString levelToString(Logger::Level level) {
    switch (level) {
        case Logger::Level::Trace: return "trace";
        case Logger::Level::Debug: return "debug";
        case Logger::Level::Info: return "info";
        case Logger::Level::Warn: return "warn";
        case Logger::Level::Error: return "error";
        case Logger::Level::Critical: return "critical";
    }
    return "warn";
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    REPOGUARD_DEBUG("Config initialized for {}/{}",
                    organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    REPOGUARD_DEBUG("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    const QString level = getString("logging/level", levelToString(settings.level));
    settings.level = Logger::parseLevel(level.toStdString(), settings.level);
    settings.filePath = getString("logging/file");
    return settings;
}

Config::ValidationSettings Config::getValidationSettings() const {
    ValidationSettings settings;
    const QString platform = getString("validation/targetPlatform",
                                       targetPlatformToString(settings.targetPlatform));
    settings.targetPlatform = targetPlatformFromString(platform);
    return settings;
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/level", levelToString(settings.level));
    setValue("logging/file", settings.filePath);
}

void Config::setValidationSettings(const ValidationSettings& settings) {
    setValue("validation/targetPlatform", targetPlatformToString(settings.targetPlatform));
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace RepoGuard

#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace WordFinder {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    WORDFINDER_INFO("Config initialized for {}/{}",
                    organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    ensureDirectoriesExist();
    WORDFINDER_INFO("Config initialized from {}", iniPath.toStdString());
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

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::TranscriptionSettings Config::getTranscriptionSettings() const {
    TranscriptionSettings settings;
    settings.modelName = getString("transcription/modelName", "base");
    settings.language = getString("transcription/language", "en");
    settings.modelsPath = getString("transcription/modelsPath", getDataPath() + "/models");
    settings.threads = qMax(0, getInt("transcription/threads", 0));
    settings.useGpu = getBool("transcription/useGpu", false);
    return settings;
}

QString Config::getLogLevel() const {
    return getString("logging/level", "info").toLower();
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getLogFilePath() const {
    return getDataPath() + "/wordfinder.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getString("transcription/modelsPath", getDataPath() + "/models")
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            WORDFINDER_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace WordFinder

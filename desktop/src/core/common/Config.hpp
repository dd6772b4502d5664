#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace WordFinder {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "WordFinder",
                   const QString& applicationName = "WordFinderDesktop");

    // Reads settings from an explicit INI file instead of the platform store
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const { return settings_ != nullptr; }

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct TranscriptionSettings {
        QString modelName = "base";
        QString language = "en";
        QString modelsPath;
        int threads = 0;        // 0 = ideal thread count
        bool useGpu = false;
    };

    TranscriptionSettings getTranscriptionSettings() const;
    QString getLogLevel() const;

    QString getDataPath() const;
    QString getLogFilePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace WordFinder

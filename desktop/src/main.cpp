#include <QtGui/QGuiApplication>
#include <QtQml/QQmlApplicationEngine>
#include <QtQml/QQmlContext>
#include <QtQml/qqml.h>
#include <QtCore/QFileInfo>

#include <memory>

#include "core/common/Logger.hpp"
#include "core/common/Config.hpp"
#include "core/search/WordSearchJob.hpp"
#include "core/transcription/WhisperTranscriber.hpp"
#include "ui/controllers/WordFinderController.hpp"

int main(int argc, char *argv[])
{
    qputenv("QT_QUICK_CONTROLS_STYLE", "Fusion");

    QGuiApplication app(argc, argv);

    app.setApplicationName("WordFinderDesktop");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("WordFinder");

    try {
        auto& config = WordFinder::Config::instance();
        config.initialize();

        auto& logger = WordFinder::Logger::instance();
        logger.initialize(config.getLogFilePath().toStdString(),
                          WordFinder::Logger::levelFromString(config.getLogLevel().toStdString()));

        logger.info("Starting WordFinder Desktop v{}", app.applicationVersion().toStdString());

        const auto settings = config.getTranscriptionSettings();
        logger.info("Model '{}' from {}, language {}",
                    settings.modelName.toStdString(),
                    settings.modelsPath.toStdString(),
                    settings.language.toStdString());

        WordFinder::TranscriptionOptions options;
        options.modelName = settings.modelName;
        options.modelsPath = settings.modelsPath;
        options.threads = settings.threads;
        options.useGpu = settings.useGpu;

        auto transcriber = std::make_shared<WordFinder::WhisperTranscriber>();
        auto job = std::make_shared<WordFinder::WordSearchJob>(transcriber, settings.language, options);

        qmlRegisterType<WordFinder::WordFinderController>("WordFinder", 1, 0, "WordFinderController");

        QQmlApplicationEngine engine;

        auto controller = std::make_unique<WordFinder::WordFinderController>();
        controller->setSearchJob(job);

        // "Open with": the first argument pre-fills the input
        const QStringList arguments = app.arguments();
        if (arguments.size() > 1) {
            const QFileInfo openWith(arguments.at(1));
            logger.info("Opened with {}", openWith.absoluteFilePath().toStdString());
            controller->setInputPath(openWith.absoluteFilePath());
        }

        engine.rootContext()->setContextProperty("wordFinderController", controller.get());

        const QUrl url(QStringLiteral("qrc:/qt/qml/WordFinder/qml/main.qml"));
        logger.info("Loading QML file: {}", url.toString().toStdString());
        QObject::connect(&engine, &QQmlApplicationEngine::objectCreated,
                         &app, [url](QObject *obj, const QUrl &objUrl) {
            if (!obj && url == objUrl) {
                QCoreApplication::exit(-1);
            }
        }, Qt::QueuedConnection);

        engine.load(url);

        if (engine.rootObjects().isEmpty()) {
            logger.error("Failed to load QML interface");
            return -1;
        }

        logger.info("Application started successfully");

        int result = app.exec();

        config.sync();
        logger.info("Application shutdown complete");

        return result;

    } catch (const std::exception& e) {
        WordFinder::Logger::instance().critical("Fatal error: {}", e.what());
        return -1;
    }
}

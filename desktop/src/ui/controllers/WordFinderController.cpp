#include "WordFinderController.hpp"
#include "../../core/common/Logger.hpp"

#include <QDesktopServices>
#include <QFileInfo>
#include <QFutureWatcher>

namespace WordFinder {

WordFinderController::WordFinderController(QObject* parent)
    : QObject(parent) {
    Logger::instance().info("WordFinderController created");
}

void WordFinderController::setSearchJob(std::shared_ptr<WordSearchJob> job) {
    job_ = std::move(job);
}

QString WordFinderController::statusText() const {
    return isSearching_ ? QStringLiteral("Searching...") : QStringLiteral("Find");
}

void WordFinderController::setInputPath(const QString& path) {
    if (inputPath_ != path) {
        inputPath_ = path;
        emit inputPathChanged();
    }
}

void WordFinderController::setWordsText(const QString& text) {
    if (wordsText_ != text) {
        wordsText_ = text;
        words_ = WordList::parse(text);
        emit wordsTextChanged();
    }
}

void WordFinderController::setInputFromUrl(const QUrl& url) {
    if (!url.isLocalFile()) {
        Logger::instance().warn("Ignoring non-local drop: {}", url.toString().toStdString());
        return;
    }
    setInputPath(url.toLocalFile());
}

void WordFinderController::find() {
    if (isSearching_) {
        Logger::instance().debug("Search already running, ignoring request");
        return;
    }

    QFileInfo input(inputPath_);
    if (inputPath_.isEmpty() || !input.isFile()) {
        Logger::instance().warn("Input not found: '{}'", inputPath_.toStdString());
        emit errorOccurred(QStringLiteral("File not found!"));
        return;
    }

    if (!job_) {
        Logger::instance().error("No search job configured");
        emit errorOccurred(QStringLiteral("Transcription is not available"));
        return;
    }

    setSearching(true);

    auto future = job_->start(input.absoluteFilePath(), words_);
    auto watcher = new QFutureWatcher<SearchResult>(this);
    connect(watcher, &QFutureWatcher<SearchResult>::finished, this, [this, watcher]() {
        const SearchResult result = watcher->result();
        watcher->deleteLater();
        handleResult(result);
    });
    watcher->setFuture(future);
}

void WordFinderController::handleResult(const SearchResult& result) {
    setSearching(false);

    if (result.hasError()) {
        Logger::instance().error("Search failed: {}", result.error().message.toStdString());
        emit errorOccurred(result.error().message);
        return;
    }

    const QString outputPath = result.value();
    setInputPath(QString());
    emit searchCompleted(outputPath);

    if (openReportOnSuccess_ && !QDesktopServices::openUrl(QUrl::fromLocalFile(outputPath))) {
        Logger::instance().warn("No handler could open {}", outputPath.toStdString());
    }
}

void WordFinderController::setSearching(bool searching) {
    if (isSearching_ != searching) {
        isSearching_ = searching;
        emit searchingChanged();
    }
}

} // namespace WordFinder

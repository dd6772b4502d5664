#pragma once

#include <QFuture>
#include <QString>
#include <memory>
#include "../common/Expected.hpp"
#include "../transcription/Transcriber.hpp"
#include "WordList.hpp"

namespace WordFinder {

struct SearchFailure {
    enum class Stage {
        Transcription,
        Filtering,
        Writing
    };

    Stage stage = Stage::Transcription;
    QString message;
};

using SearchResult = Expected<QString, SearchFailure>;

/**
 * @brief One word-search run: transcribe, filter, write the report
 *
 * Produces exactly one terminal result, the report path or the first
 * failure. The report is only written once transcription and filtering
 * have both succeeded.
 */
class WordSearchJob {
public:
    WordSearchJob(std::shared_ptr<Transcriber> transcriber,
                  QString language = QStringLiteral("en"),
                  TranscriptionOptions options = TranscriptionOptions());

    SearchResult run(const QString& inputPath, const WordList& words) const;

    // Runs on the global thread pool. The job is copied into the task.
    QFuture<SearchResult> start(const QString& inputPath, const WordList& words) const;

    const QString& language() const { return language_; }
    const TranscriptionOptions& options() const { return options_; }

private:
    std::shared_ptr<Transcriber> transcriber_;
    QString language_;
    TranscriptionOptions options_;
};

} // namespace WordFinder

#include "WordSearchJob.hpp"
#include "ReportWriter.hpp"
#include "SegmentFilter.hpp"
#include "../common/Logger.hpp"

#include <QElapsedTimer>
#include <QtConcurrent>

namespace WordFinder {

WordSearchJob::WordSearchJob(std::shared_ptr<Transcriber> transcriber,
                             QString language,
                             TranscriptionOptions options)
    : transcriber_(std::move(transcriber))
    , language_(std::move(language))
    , options_(std::move(options)) {
}

SearchResult WordSearchJob::run(const QString& inputPath, const WordList& words) const {
    QElapsedTimer timer;
    timer.start();

    const QString outputPath = ReportWriter::outputPathFor(inputPath);
    WORDFINDER_INFO("Searching {} for {} words, report goes to {}",
                    inputPath.toStdString(), words.size(), outputPath.toStdString());

    if (!transcriber_) {
        WORDFINDER_ERROR("No transcriber configured");
        return makeUnexpected(SearchFailure{SearchFailure::Stage::Transcription,
                                            toString(TranscriptionError::ModelLoadFailed)});
    }

    auto segments = transcriber_->transcribe(inputPath, language_, options_);
    if (segments.hasError()) {
        WORDFINDER_ERROR("Transcription of {} failed: {}",
                         inputPath.toStdString(), toString(segments.error()).toStdString());
        return makeUnexpected(SearchFailure{SearchFailure::Stage::Transcription,
                                            toString(segments.error())});
    }
    WORDFINDER_INFO("Transcribed {} segments", segments.value().size());

    auto lines = SegmentFilter::filter(segments.value(), words);
    if (lines.hasError()) {
        return makeUnexpected(SearchFailure{SearchFailure::Stage::Filtering,
                                            toString(lines.error())});
    }
    WORDFINDER_INFO("{} segments matched", lines.value().size());

    auto written = ReportWriter::write(outputPath, lines.value());
    if (written.hasError()) {
        return makeUnexpected(SearchFailure{SearchFailure::Stage::Writing,
                                            toString(written.error())});
    }

    WORDFINDER_INFO("Search finished in {} ms", timer.elapsed());
    return outputPath;
}

QFuture<SearchResult> WordSearchJob::start(const QString& inputPath, const WordList& words) const {
    WordSearchJob job = *this;
    return QtConcurrent::run([job, inputPath, words]() -> SearchResult {
        return job.run(inputPath, words);
    });
}

} // namespace WordFinder

#include "SegmentFilter.hpp"
#include "TimestampFormatter.hpp"
#include "../common/Logger.hpp"

namespace WordFinder {

Expected<ResultLines, SearchError> SegmentFilter::filter(const TranscriptSegments& segments,
                                                         const WordList& words) {
    const QStringList loweredWords = words.toLower();
    ResultLines lines;

    for (const auto& segment : segments) {
        auto timestamp = TimestampFormatter::formatDisplay(segment.startSeconds);
        if (timestamp.hasError()) {
            WORDFINDER_ERROR("Segment start time {} cannot be formatted", segment.startSeconds);
            return makeUnexpected(timestamp.error());
        }

        if (matches(segment.text, loweredWords)) {
            lines.append(ResultLine{timestamp.value(), segment.text.trimmed()});
        }
    }

    WORDFINDER_DEBUG("{} of {} segments matched {} words",
                     lines.size(), segments.size(), loweredWords.size());
    return lines;
}

bool SegmentFilter::matches(const QString& text, const QStringList& loweredWords) {
    if (loweredWords.isEmpty()) {
        return false;
    }

    const QString loweredText = text.toLower();
    for (const QString& word : loweredWords) {
        if (loweredText.contains(word)) {
            return true;
        }
    }
    return false;
}

} // namespace WordFinder

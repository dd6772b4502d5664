#pragma once

#include "../common/Expected.hpp"
#include "../transcription/TranscriptionTypes.hpp"
#include "SearchTypes.hpp"
#include "WordList.hpp"

namespace WordFinder {

/**
 * @brief Keeps the transcript segments that mention any of the search words
 *
 * Matching is a case-insensitive substring test. The result preserves input
 * order and holds at most one line per segment. An empty word list matches
 * nothing. A segment with an invalid start time fails the whole call.
 */
class SegmentFilter {
public:
    static Expected<ResultLines, SearchError> filter(const TranscriptSegments& segments,
                                                     const WordList& words);

    static bool matches(const QString& text, const QStringList& loweredWords);
};

} // namespace WordFinder

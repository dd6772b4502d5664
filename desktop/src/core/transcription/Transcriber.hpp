#pragma once

#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "TranscriptionTypes.hpp"

namespace WordFinder {

/**
 * @brief Speech-to-text collaborator
 *
 * Turns a media file into an ordered list of timed text segments.
 * Implementations must be callable from a worker thread.
 */
class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual Expected<TranscriptSegments, TranscriptionError> transcribe(
        const QString& mediaPath,
        const QString& language,
        const TranscriptionOptions& options) = 0;
};

} // namespace WordFinder

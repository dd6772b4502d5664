#pragma once

#include <QtCore/QString>
#include <vector>

#include "../common/Expected.hpp"

namespace WordFinder {

enum class DecodeError {
    OpenFailed,
    NoAudioStream,
    DecoderUnavailable,
    DecodingFailed,
    ResampleFailed,
    EmptyAudio
};

QString toString(DecodeError error);

/**
 * @brief Decodes the best audio stream of any media file into PCM
 *
 * Output is mono float32 at TARGET_SAMPLE_RATE, the format whisper.cpp
 * consumes. Video streams are ignored.
 */
class AudioDecoder {
public:
    static constexpr int TARGET_SAMPLE_RATE = 16000;

    static Expected<std::vector<float>, DecodeError> decode(const QString& mediaPath);

private:
    static QString avErrorString(int averror);
};

} // namespace WordFinder

#include "TranscriptionTypes.hpp"

namespace WordFinder {

QString toString(TranscriptionError error) {
    switch (error) {
        case TranscriptionError::InputNotFound:
            return "Media file not found";
        case TranscriptionError::AudioProcessingFailed:
            return "Could not decode the audio track";
        case TranscriptionError::ModelNotFound:
            return "Whisper model file not found";
        case TranscriptionError::ModelLoadFailed:
            return "Failed to load the Whisper model";
        case TranscriptionError::InferenceError:
            return "Speech recognition failed";
        case TranscriptionError::UnsupportedLanguage:
            return "Unsupported transcription language";
    }
    return "Unknown transcription error";
}

} // namespace WordFinder

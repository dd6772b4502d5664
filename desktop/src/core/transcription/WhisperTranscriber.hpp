#pragma once

#include <QMutex>
#include <QString>
#include <QStringList>
#include <memory>
#include "Transcriber.hpp"

namespace WordFinder {

class WhisperWrapper;

/**
 * @brief Transcriber backed by whisper.cpp
 *
 * Decodes the media with FFmpeg, loads the configured model on first use
 * and keeps it until a different model is requested.
 */
class WhisperTranscriber : public Transcriber {
public:
    WhisperTranscriber();
    ~WhisperTranscriber() override;

    Expected<TranscriptSegments, TranscriptionError> transcribe(
        const QString& mediaPath,
        const QString& language,
        const TranscriptionOptions& options) override;

    /**
     * @brief Resolve a model name to a file
     *
     * A name that already points at an existing file is returned as is.
     * Otherwise ggml-<name>.bin, <name>.bin and ggml-<name>.gguf are tried
     * in modelsPath. Returns an empty string when nothing exists.
     */
    static QString resolveModelPath(const QString& modelName, const QString& modelsPath);

    static QStringList candidateFileNames(const QString& modelName);

private:
    Expected<void, TranscriptionError> ensureModel(const TranscriptionOptions& options);

    QMutex mutex_;
    std::unique_ptr<WhisperWrapper> whisper_;
};

} // namespace WordFinder

#include "WhisperTranscriber.hpp"
#include "WhisperWrapper.hpp"
#include "../common/Logger.hpp"
#include "../media/AudioDecoder.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QThread>

namespace WordFinder {

WhisperTranscriber::WhisperTranscriber()
    : whisper_(std::make_unique<WhisperWrapper>()) {
}

WhisperTranscriber::~WhisperTranscriber() = default;

QStringList WhisperTranscriber::candidateFileNames(const QString& modelName) {
    return {
        QString("ggml-%1.bin").arg(modelName),
        QString("%1.bin").arg(modelName),
        QString("ggml-%1.gguf").arg(modelName)
    };
}

QString WhisperTranscriber::resolveModelPath(const QString& modelName, const QString& modelsPath) {
    if (modelName.isEmpty()) {
        return QString();
    }

    QFileInfo direct(modelName);
    if (direct.isFile()) {
        return direct.absoluteFilePath();
    }

    const QDir dir(modelsPath);
    for (const QString& fileName : candidateFileNames(modelName)) {
        QFileInfo candidate(dir.filePath(fileName));
        if (candidate.isFile()) {
            return candidate.absoluteFilePath();
        }
    }
    return QString();
}

Expected<void, TranscriptionError> WhisperTranscriber::ensureModel(const TranscriptionOptions& options) {
    const QString modelPath = resolveModelPath(options.modelName, options.modelsPath);
    if (modelPath.isEmpty()) {
        WORDFINDER_ERROR("No model file for '{}' in {}",
                         options.modelName.toStdString(), options.modelsPath.toStdString());
        return makeUnexpected(TranscriptionError::ModelNotFound);
    }

    if (whisper_->isModelLoaded() && whisper_->loadedModelPath() == modelPath) {
        return {};
    }

    auto loaded = whisper_->loadModel(modelPath, options.useGpu);
    if (loaded.hasError()) {
        return makeUnexpected(loaded.error() == WhisperError::ModelNotFound
                                  ? TranscriptionError::ModelNotFound
                                  : TranscriptionError::ModelLoadFailed);
    }
    return {};
}

Expected<TranscriptSegments, TranscriptionError> WhisperTranscriber::transcribe(
    const QString& mediaPath,
    const QString& language,
    const TranscriptionOptions& options) {

    if (!QFileInfo(mediaPath).isFile()) {
        WORDFINDER_ERROR("Input file not found: {}", mediaPath.toStdString());
        return makeUnexpected(TranscriptionError::InputNotFound);
    }

    if (!WhisperWrapper::isLanguageSupported(language)) {
        WORDFINDER_ERROR("Unsupported language: {}", language.toStdString());
        return makeUnexpected(TranscriptionError::UnsupportedLanguage);
    }

    auto audio = AudioDecoder::decode(mediaPath);
    if (audio.hasError()) {
        WORDFINDER_ERROR("Audio decoding failed: {}", toString(audio.error()).toStdString());
        return makeUnexpected(TranscriptionError::AudioProcessingFailed);
    }

    QMutexLocker locker(&mutex_);

    auto model = ensureModel(options);
    if (model.hasError()) {
        return makeUnexpected(model.error());
    }

    WhisperConfig config;
    config.language = language;
    config.nThreads = options.threads > 0 ? options.threads : QThread::idealThreadCount();

    auto result = whisper_->transcribe(audio.value(), config);
    if (result.hasError()) {
        WORDFINDER_ERROR("Inference failed: {}", toString(result.error()).toStdString());
        return makeUnexpected(TranscriptionError::InferenceError);
    }

    TranscriptSegments segments;
    segments.reserve(static_cast<qsizetype>(result.value().size()));
    for (const auto& segment : result.value()) {
        segments.append(TranscriptSegment{segment.startTime, segment.endTime, segment.text});
    }
    return segments;
}

} // namespace WordFinder

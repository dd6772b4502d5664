#include "WhisperWrapper.hpp"
#include "../common/Logger.hpp"

#include <QElapsedTimer>
#include <QFileInfo>

#include <whisper.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <string>

namespace WordFinder {

namespace {
constexpr qint64 MIN_MODEL_SIZE = 1024 * 1024; // Models should be at least 1MB
}

struct WhisperWrapper::WhisperWrapperPrivate {
    whisper_context* ctx = nullptr;
    QString loadedModelPath;
};

QString toString(WhisperError error) {
    switch (error) {
        case WhisperError::ModelNotFound:
            return "Whisper model file not found";
        case WhisperError::InvalidModel:
            return "Whisper model file is invalid";
        case WhisperError::ModelLoadFailed:
            return "Failed to load the whisper model";
        case WhisperError::InvalidInput:
            return "Audio data is empty or malformed";
        case WhisperError::InferenceFailed:
            return "Speech recognition failed";
    }
    return "Unknown whisper error";
}

WhisperWrapper::WhisperWrapper()
    : d(std::make_unique<WhisperWrapperPrivate>()) {
    installLogRouting();
}

WhisperWrapper::~WhisperWrapper() {
    unloadModel();
}

void WhisperWrapper::installLogRouting() {
    static std::once_flag once;
    std::call_once(once, []() {
        whisper_log_set([](enum ggml_log_level level, const char* text, void* user_data) {
            Q_UNUSED(user_data)
            const std::string message = QString::fromUtf8(text).trimmed().toStdString();
            if (message.empty()) {
                return;
            }

            switch (level) {
                case GGML_LOG_LEVEL_ERROR:
                    Logger::instance().error("whisper: {}", message);
                    break;
                case GGML_LOG_LEVEL_WARN:
                    Logger::instance().warn("whisper: {}", message);
                    break;
                default:
                    Logger::instance().debug("whisper: {}", message);
                    break;
            }
        }, nullptr);
    });
}

Expected<void, WhisperError> WhisperWrapper::loadModel(const QString& modelPath, bool useGpu) {
    unloadModel();

    QFileInfo modelFile(modelPath);
    if (!modelFile.exists() || !modelFile.isFile()) {
        Logger::instance().error("Model file not found: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::ModelNotFound);
    }

    if (modelFile.size() < MIN_MODEL_SIZE) {
        Logger::instance().error("Model file too small: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::InvalidModel);
    }

    Logger::instance().info("Loading model: {}", modelPath.toStdString());

    const std::string modelPathStd = modelPath.toStdString();
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu;

    d->ctx = whisper_init_from_file_with_params(modelPathStd.c_str(), cparams);
    if (!d->ctx) {
        Logger::instance().error("Failed to load model: {}", modelPath.toStdString());
        return makeUnexpected(WhisperError::ModelLoadFailed);
    }

    d->loadedModelPath = modelPath;
    Logger::instance().info("Model loaded: {} (vocab: {}, gpu: {})",
                            modelFile.fileName().toStdString(),
                            whisper_n_vocab(d->ctx), useGpu);
    return {};
}

bool WhisperWrapper::isModelLoaded() const {
    return d->ctx != nullptr;
}

QString WhisperWrapper::loadedModelPath() const {
    return d->loadedModelPath;
}

void WhisperWrapper::unloadModel() {
    if (d->ctx) {
        whisper_free(d->ctx);
        d->ctx = nullptr;
        d->loadedModelPath.clear();
        Logger::instance().info("Model unloaded");
    }
}

Expected<std::vector<WhisperSegment>, WhisperError> WhisperWrapper::transcribe(
    const std::vector<float>& audioData,
    const WhisperConfig& config) {

    if (!isModelLoaded()) {
        Logger::instance().error("No model loaded for transcription");
        return makeUnexpected(WhisperError::ModelLoadFailed);
    }

    if (audioData.empty()) {
        Logger::instance().error("Empty audio data provided");
        return makeUnexpected(WhisperError::InvalidInput);
    }

    const bool allFinite = std::all_of(audioData.begin(), audioData.end(),
                                       [](float sample) { return std::isfinite(sample); });
    if (!allFinite) {
        Logger::instance().error("Audio data contains non-finite samples");
        return makeUnexpected(WhisperError::InvalidInput);
    }

    // params.language points into this buffer for the duration of whisper_full
    const std::string language = config.language.isEmpty()
        ? std::string("auto") : config.language.toStdString();

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    params.language = language.c_str();
    params.n_threads = std::max(1, config.nThreads);
    params.beam_search.beam_size = std::max(1, config.beamSize);
    params.temperature = config.temperature;
    params.translate = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.print_timestamps = false;

    QElapsedTimer timer;
    timer.start();
    Logger::instance().info("Starting inference on {} samples ({} threads, language {})",
                            audioData.size(), params.n_threads, language);

    const int result = whisper_full(d->ctx, params, audioData.data(), static_cast<int>(audioData.size()));
    if (result != 0) {
        Logger::instance().error("whisper_full failed with code {}", result);
        return makeUnexpected(WhisperError::InferenceFailed);
    }

    auto segments = extractSegments();
    Logger::instance().info("Inference completed in {:.2f}s, {} segments",
                            timer.elapsed() / 1000.0, segments.size());
    return segments;
}

std::vector<WhisperSegment> WhisperWrapper::extractSegments() const {
    std::vector<WhisperSegment> segments;

    const int nSegments = whisper_full_n_segments(d->ctx);
    segments.reserve(static_cast<size_t>(std::max(0, nSegments)));

    for (int i = 0; i < nSegments; ++i) {
        WhisperSegment segment;
        segment.startTime = whisper_full_get_segment_t0(d->ctx, i) / 100.0; // centiseconds
        segment.endTime = whisper_full_get_segment_t1(d->ctx, i) / 100.0;

        const char* text = whisper_full_get_segment_text(d->ctx, i);
        if (text) {
            segment.text = QString::fromUtf8(text);
        }
        segments.push_back(segment);
    }

    return segments;
}

bool WhisperWrapper::isLanguageSupported(const QString& language) {
    if (language.isEmpty() || language == "auto") {
        return true;
    }
    return whisper_lang_id(language.toStdString().c_str()) >= 0;
}

QString WhisperWrapper::getSystemInfo() {
    return QString::fromUtf8(whisper_print_system_info());
}

} // namespace WordFinder

#pragma once

#include <memory>
#include <vector>
#include <QtCore/QString>
#include "../common/Expected.hpp"

// Forward declare whisper.cpp types to avoid including the header here
struct whisper_context;

namespace WordFinder {

enum class WhisperError {
    ModelNotFound,
    InvalidModel,
    ModelLoadFailed,
    InvalidInput,
    InferenceFailed
};

QString toString(WhisperError error);

struct WhisperSegment {
    double startTime = 0.0;  // in seconds
    double endTime = 0.0;    // in seconds
    QString text;
};

struct WhisperConfig {
    QString language = "en";
    int nThreads = 4;
    int beamSize = 5;
    float temperature = 0.0f;
};

/**
 * @brief Owns one whisper.cpp context
 *
 * Not thread-safe. Callers serialise access to a single instance.
 */
class WhisperWrapper {
public:
    WhisperWrapper();
    ~WhisperWrapper();

    // Non-copyable, non-movable
    WhisperWrapper(const WhisperWrapper&) = delete;
    WhisperWrapper& operator=(const WhisperWrapper&) = delete;
    WhisperWrapper(WhisperWrapper&&) = delete;
    WhisperWrapper& operator=(WhisperWrapper&&) = delete;

    /**
     * @brief Load a ggml/gguf model, replacing any loaded one
     * @param modelPath Path to the model file
     * @param useGpu Let whisper.cpp offload to a GPU backend when one is compiled in
     */
    Expected<void, WhisperError> loadModel(const QString& modelPath, bool useGpu = false);

    bool isModelLoaded() const;
    QString loadedModelPath() const;
    void unloadModel();

    /**
     * @brief Run inference on 16 kHz mono float PCM
     * @return Segments in transcript order
     */
    Expected<std::vector<WhisperSegment>, WhisperError> transcribe(
        const std::vector<float>& audioData,
        const WhisperConfig& config = WhisperConfig{});

    // Language codes ("en", "de") known to whisper.cpp, plus "auto"
    static bool isLanguageSupported(const QString& language);

    static QString getSystemInfo();

private:
    struct WhisperWrapperPrivate;
    std::unique_ptr<WhisperWrapperPrivate> d;

    static void installLogRouting();
    std::vector<WhisperSegment> extractSegments() const;
};

} // namespace WordFinder

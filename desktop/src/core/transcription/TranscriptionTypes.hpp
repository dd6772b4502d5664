#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

namespace WordFinder {

enum class TranscriptionError {
    InputNotFound,
    AudioProcessingFailed,
    ModelNotFound,
    ModelLoadFailed,
    InferenceError,
    UnsupportedLanguage
};

struct TranscriptSegment {
    double startSeconds = 0.0;
    double endSeconds = 0.0;   // informational only
    QString text;
};

using TranscriptSegments = QList<TranscriptSegment>;

struct TranscriptionOptions {
    QString modelName = "base";   // model size ("base", "small.en") or a model file path
    QString modelsPath;
    int threads = 0;              // 0 = QThread::idealThreadCount()
    bool useGpu = false;
};

QString toString(TranscriptionError error);

} // namespace WordFinder

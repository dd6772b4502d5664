#pragma once

#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "SearchTypes.hpp"

namespace WordFinder {

enum class ReportError {
    OpenFailed,
    WriteFailed
};

QString toString(ReportError error);

// Writes matched lines as "<timestamp> - <text>" entries separated by blank lines
class ReportWriter {
public:
    // <dir of media>/<name up to the last '.'>.txt
    static QString outputPathFor(const QString& mediaPath);

    static QString render(const ResultLines& lines);

    // Truncates any existing file; an empty result still produces an (empty) file
    static Expected<void, ReportError> write(const QString& path, const ResultLines& lines);
};

} // namespace WordFinder

#include "ReportWriter.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

namespace WordFinder {

QString toString(ReportError error) {
    switch (error) {
        case ReportError::OpenFailed:
            return "Could not create the output file";
        case ReportError::WriteFailed:
            return "Could not write the output file";
    }
    return "Unknown report error";
}

QString ReportWriter::outputPathFor(const QString& mediaPath) {
    QFileInfo info(mediaPath);
    return QDir(info.absolutePath()).filePath(info.completeBaseName() + ".txt");
}

QString ReportWriter::render(const ResultLines& lines) {
    QString report;
    for (const auto& line : lines) {
        report += line.timestamp + " - " + line.text + "\n\n";
    }
    return report;
}

Expected<void, ReportError> ReportWriter::write(const QString& path, const ResultLines& lines) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        WORDFINDER_ERROR("Cannot open report file {}: {}",
                         path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ReportError::OpenFailed);
    }

    const QByteArray data = render(lines).toUtf8();
    if (file.write(data) != data.size()) {
        WORDFINDER_ERROR("Short write to report file {}: {}",
                         path.toStdString(), file.errorString().toStdString());
        file.cancelWriting();
        return makeUnexpected(ReportError::WriteFailed);
    }

    if (!file.commit()) {
        WORDFINDER_ERROR("Cannot commit report file {}: {}",
                         path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ReportError::WriteFailed);
    }

    WORDFINDER_INFO("Wrote {} matching segments to {}", lines.size(), path.toStdString());
    return {};
}

} // namespace WordFinder

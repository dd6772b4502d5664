#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

namespace WordFinder {

enum class SearchError {
    InvalidTimestamp
};

// One matched transcript segment, ready for the report
struct ResultLine {
    QString timestamp;
    QString text;

    bool operator==(const ResultLine& other) const {
        return timestamp == other.timestamp && text == other.text;
    }
    bool operator!=(const ResultLine& other) const { return !(*this == other); }
};

using ResultLines = QList<ResultLine>;

QString toString(SearchError error);

} // namespace WordFinder

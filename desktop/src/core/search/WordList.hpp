#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace WordFinder {

// Ordered, case-preserving list of search words. Duplicates are kept.
class WordList {
public:
    WordList() = default;
    explicit WordList(const QStringList& words);

    // Splits on ',', trims each token and drops the empty ones
    static WordList parse(const QString& text);

    const QStringList& words() const { return words_; }
    QStringList toLower() const;

    bool isEmpty() const { return words_.isEmpty(); }
    int size() const { return static_cast<int>(words_.size()); }

    bool operator==(const WordList& other) const { return words_ == other.words_; }

private:
    QStringList words_;
};

} // namespace WordFinder

#include "WordList.hpp"

namespace WordFinder {

WordList::WordList(const QStringList& words) {
    for (const QString& word : words) {
        const QString trimmed = word.trimmed();
        if (!trimmed.isEmpty()) {
            words_ << trimmed;
        }
    }
}

WordList WordList::parse(const QString& text) {
    return WordList(text.split(QLatin1Char(',')));
}

QStringList WordList::toLower() const {
    QStringList lowered;
    lowered.reserve(words_.size());
    for (const QString& word : words_) {
        lowered << word.toLower();
    }
    return lowered;
}

} // namespace WordFinder

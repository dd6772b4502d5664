#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <memory>
#include "../../core/search/WordList.hpp"
#include "../../core/search/WordSearchJob.hpp"

namespace WordFinder {

class WordFinderController : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString inputPath READ inputPath WRITE setInputPath NOTIFY inputPathChanged)
    Q_PROPERTY(QString wordsText READ wordsText WRITE setWordsText NOTIFY wordsTextChanged)
    Q_PROPERTY(int wordCount READ wordCount NOTIFY wordsTextChanged)
    Q_PROPERTY(bool isSearching READ isSearching NOTIFY searchingChanged)
    Q_PROPERTY(QString statusText READ statusText NOTIFY searchingChanged)

public:
    explicit WordFinderController(QObject* parent = nullptr);

    void setSearchJob(std::shared_ptr<WordSearchJob> job);

    // When disabled the finished report is not handed to the desktop
    void setOpenReportOnSuccess(bool enabled) { openReportOnSuccess_ = enabled; }

    QString inputPath() const { return inputPath_; }
    QString wordsText() const { return wordsText_; }
    int wordCount() const { return words_.size(); }
    const WordList& words() const { return words_; }
    bool isSearching() const { return isSearching_; }
    QString statusText() const;

    void setInputPath(const QString& path);
    void setWordsText(const QString& text);

public slots:
    // Drag-and-drop target; only local file URLs are accepted
    void setInputFromUrl(const QUrl& url);
    void find();

signals:
    void inputPathChanged();
    void wordsTextChanged();
    void searchingChanged();
    void searchCompleted(const QString& outputPath);
    void errorOccurred(const QString& message);

private:
    void setSearching(bool searching);
    void handleResult(const SearchResult& result);

    std::shared_ptr<WordSearchJob> job_;
    QString inputPath_;
    QString wordsText_;
    WordList words_;
    bool isSearching_ = false;
    bool openReportOnSuccess_ = true;
};

} // namespace WordFinder

#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <memory>
#include "../src/ui/controllers/WordFinderController.hpp"
#include "utils/MockComponents.hpp"
#include "utils/TestUtils.hpp"

using namespace WordFinder;
using namespace WordFinder::Test;

class TestWordFinderController : public QObject {
    Q_OBJECT

private slots:
    void init() {
        testDir_ = TestUtils::createTempDirectory("controller");
        QVERIFY(!testDir_.isEmpty());
        mediaPath_ = TestUtils::createTestTextFile(testDir_, "placeholder", "interview.mov");

        transcriber_ = std::make_shared<MockTranscriber>(TranscriptSegments{
            TranscriptSegment{0.0, 2.0, "hello there"},
            TranscriptSegment{3.0, 4.0, "nothing"}
        });

        controller_ = std::make_unique<WordFinderController>();
        controller_->setSearchJob(std::make_shared<WordSearchJob>(transcriber_));
        controller_->setOpenReportOnSuccess(false);
    }

    void cleanup() {
        // Never leave a worker blocked on the gate
        transcriber_->setBlocking(false);
        transcriber_->release();
        TestUtils::waitForCondition([this]() { return !controller_->isSearching(); }, 5000);
        controller_.reset();
    }

    void testInitialState() {
        QVERIFY(!controller_->isSearching());
        QCOMPARE(controller_->statusText(), QString("Find"));
        QVERIFY(controller_->inputPath().isEmpty());
        QCOMPARE(controller_->wordCount(), 0);
    }

    void testWordsTextIsParsed() {
        QSignalSpy spy(controller_.get(), &WordFinderController::wordsTextChanged);

        controller_->setWordsText("hello, , there ,general");
        QCOMPARE(controller_->wordCount(), 3);
        QCOMPARE(spy.count(), 1);

        controller_->setWordsText("hello, , there ,general");
        QCOMPARE(spy.count(), 1);
    }

    void testDropAcceptsLocalFilesOnly() {
        controller_->setInputFromUrl(QUrl::fromLocalFile(mediaPath_));
        QCOMPARE(controller_->inputPath(), mediaPath_);

        controller_->setInputFromUrl(QUrl("https://example.com/video.mp4"));
        QCOMPARE(controller_->inputPath(), mediaPath_);
    }

    void testMissingFileIsRejected() {
        QSignalSpy errorSpy(controller_.get(), &WordFinderController::errorOccurred);
        QSignalSpy searchingSpy(controller_.get(), &WordFinderController::searchingChanged);

        controller_->setInputPath(QDir(testDir_).filePath("does_not_exist.mp4"));
        controller_->setWordsText("hello");
        controller_->find();

        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.takeFirst().at(0).toString(), QString("File not found!"));
        QCOMPARE(searchingSpy.count(), 0);
        QCOMPARE(transcriber_->getCallCount(), 0);
    }

    void testDirectoryIsRejected() {
        QSignalSpy errorSpy(controller_.get(), &WordFinderController::errorOccurred);

        controller_->setInputPath(testDir_);
        controller_->find();

        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(transcriber_->getCallCount(), 0);
    }

    void testSuccessfulSearch() {
        QSignalSpy completedSpy(controller_.get(), &WordFinderController::searchCompleted);
        QSignalSpy errorSpy(controller_.get(), &WordFinderController::errorOccurred);

        controller_->setInputPath(mediaPath_);
        controller_->setWordsText("hello");
        controller_->find();

        QVERIFY(completedSpy.wait(5000));
        QCOMPARE(errorSpy.count(), 0);

        const QString reportPath = completedSpy.takeFirst().at(0).toString();
        QCOMPARE(QFileInfo(reportPath).fileName(), QString("interview.txt"));
        QCOMPARE(TestUtils::readTextFile(reportPath), QString("00:00 - hello there\n\n"));

        QVERIFY(controller_->inputPath().isEmpty());
        QVERIFY(!controller_->isSearching());
        QCOMPARE(controller_->statusText(), QString("Find"));
    }

    void testSecondFindWhileSearchingIsIgnored() {
        transcriber_->setBlocking(true);
        QSignalSpy completedSpy(controller_.get(), &WordFinderController::searchCompleted);

        controller_->setInputPath(mediaPath_);
        controller_->setWordsText("hello");
        controller_->find();

        QVERIFY(controller_->isSearching());
        QCOMPARE(controller_->statusText(), QString("Searching..."));
        QVERIFY(TestUtils::waitForCondition([this]() { return transcriber_->getCallCount() == 1; }));

        controller_->find();
        controller_->find();

        transcriber_->setBlocking(false);
        transcriber_->release();

        QVERIFY(completedSpy.wait(5000));
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(transcriber_->getCallCount(), 1);
        QVERIFY(!controller_->isSearching());
    }

    void testFailedSearchReportsError() {
        transcriber_->setError(TranscriptionError::AudioProcessingFailed);
        QSignalSpy errorSpy(controller_.get(), &WordFinderController::errorOccurred);
        QSignalSpy completedSpy(controller_.get(), &WordFinderController::searchCompleted);

        controller_->setInputPath(mediaPath_);
        controller_->setWordsText("hello");
        controller_->find();

        QVERIFY(errorSpy.wait(5000));
        QCOMPARE(errorSpy.takeFirst().at(0).toString(), toString(TranscriptionError::AudioProcessingFailed));
        QCOMPARE(completedSpy.count(), 0);

        // A failed run leaves the input in place and the app ready for another try
        QCOMPARE(controller_->inputPath(), mediaPath_);
        QVERIFY(!controller_->isSearching());
        QVERIFY(!QFileInfo::exists(QDir(testDir_).filePath("interview.txt")));
    }

private:
    QString testDir_;
    QString mediaPath_;
    std::shared_ptr<MockTranscriber> transcriber_;
    std::unique_ptr<WordFinderController> controller_;
};

int runTestWordFinderController(int argc, char** argv) {
    TestWordFinderController test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_word_finder_controller.moc"

#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestTimestampFormatter(int argc, char** argv);
extern int runTestWordList(int argc, char** argv);
extern int runTestSegmentFilter(int argc, char** argv);
extern int runTestReportWriter(int argc, char** argv);
extern int runTestWordSearchJob(int argc, char** argv);
extern int runTestAudioDecoder(int argc, char** argv);
extern int runTestWhisperTranscriber(int argc, char** argv);
extern int runTestWordFinderController(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    WordFinder::Test::TestUtils::initializeTestEnvironment();
    WordFinder::Logger::instance().initialize(
        (WordFinder::Test::TestUtils::getTempPath() + "/wordfinder-tests.log").toStdString(),
        WordFinder::Logger::Level::Debug);

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"TimestampFormatter", runTestTimestampFormatter},
        {"WordList", runTestWordList},
        {"SegmentFilter", runTestSegmentFilter},
        {"ReportWriter", runTestReportWriter},
        {"WordSearchJob", runTestWordSearchJob},
        {"AudioDecoder", runTestAudioDecoder},
        {"WhisperTranscriber", runTestWhisperTranscriber},
        {"WordFinderController", runTestWordFinderController}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    WordFinder::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}

#include <QtTest/QtTest>
#include "../src/core/search/SegmentFilter.hpp"

using namespace WordFinder;

namespace {
TranscriptSegment segment(double start, const QString& text) {
    TranscriptSegment s;
    s.startSeconds = start;
    s.endSeconds = start + 2.0;
    s.text = text;
    return s;
}
} // namespace

class TestSegmentFilter : public QObject {
    Q_OBJECT

private slots:
    void testEndToEndScenario() {
        TranscriptSegments segments = {
            segment(0.0, "General Kenobi, hello there"),
            segment(5.2, "Nothing interesting"),
            segment(12.75, "You fool!")
        };

        auto result = SegmentFilter::filter(segments, WordList::parse("hello,fool"));
        QVERIFY(result.hasValue());

        ResultLines expected = {
            ResultLine{"00:00", "General Kenobi, hello there"},
            ResultLine{"00:12", "You fool!"}
        };
        QCOMPARE(result.value().size(), expected.size());
        QVERIFY(result.value() == expected);
    }

    void testEmptySegments() {
        auto result = SegmentFilter::filter(TranscriptSegments(), WordList::parse("hello"));
        QVERIFY(result.hasValue());
        QVERIFY(result.value().isEmpty());
    }

    void testEmptyWordListMatchesNothing() {
        TranscriptSegments segments = {segment(1.0, "hello"), segment(2.0, "")};

        auto result = SegmentFilter::filter(segments, WordList());
        QVERIFY(result.hasValue());
        QVERIFY(result.value().isEmpty());
    }

    void testCaseInsensitiveSubstring() {
        QVERIFY(SegmentFilter::matches("Hello World", {"hello"}));
        QVERIFY(SegmentFilter::matches("unhelpful", {"help"}));
        QVERIFY(!SegmentFilter::matches("Hello World", {"goodbye"}));
        QVERIFY(!SegmentFilter::matches("Hello World", {}));

        auto result = SegmentFilter::filter({segment(0.0, "Hello World")}, WordList::parse("HELLO"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value().size(), 1);
    }

    void testOrderPreserved() {
        TranscriptSegments segments = {
            segment(1.0, "alpha match"),
            segment(2.0, "beta"),
            segment(3.0, "gamma match")
        };

        auto result = SegmentFilter::filter(segments, WordList::parse("match"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value().size(), 2);
        QCOMPARE(result.value().at(0).text, QString("alpha match"));
        QCOMPARE(result.value().at(1).text, QString("gamma match"));
    }

    void testSegmentMatchingSeveralWordsAppearsOnce() {
        auto result = SegmentFilter::filter({segment(4.0, "hello there general")},
                                            WordList::parse("hello,there,general"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value().size(), 1);
    }

    void testTextIsTrimmed() {
        auto result = SegmentFilter::filter({segment(61.0, "  hello there \n")}, WordList::parse("hello"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value().at(0).timestamp, QString("01:01"));
        QCOMPARE(result.value().at(0).text, QString("hello there"));
    }

    void testNegativeStartFailsWholeCall() {
        TranscriptSegments segments = {segment(0.0, "hello"), segment(-1.0, "unrelated")};

        auto result = SegmentFilter::filter(segments, WordList::parse("hello"));
        QVERIFY(result.hasError());
        QVERIFY(result.error() == SearchError::InvalidTimestamp);
    }

    void testIdempotent() {
        TranscriptSegments segments = {segment(0.0, "one hello"), segment(3700.0, "two hello")};
        WordList words = WordList::parse("hello");

        auto first = SegmentFilter::filter(segments, words);
        auto second = SegmentFilter::filter(segments, words);
        QVERIFY(first.hasValue() && second.hasValue());
        QVERIFY(first.value() == second.value());
        QCOMPARE(first.value().at(1).timestamp, QString("01:01:40"));
    }
};

int runTestSegmentFilter(int argc, char** argv) {
    TestSegmentFilter test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_segment_filter.moc"

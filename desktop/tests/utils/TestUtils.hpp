#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>
#include <QtCore/QEventLoop>
#include <QtCore/QFuture>
#include <QtCore/QFutureWatcher>
#include <functional>
#include <type_traits>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"

namespace WordFinder {
namespace Test {

/**
 * @brief Shared helpers for the WordFinder test suites
 */
class TestUtils {
public:
    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "wordfinder_test");
    static QString getTempPath();

    // Test file creation
    static QString createTestTextFile(const QString& directory, const QString& content, const QString& filename = "test.txt");
    static QString readTextFile(const QString& filePath);

    // Async testing utilities
    template<typename T>
    static T waitForFuture(QFuture<T> future, int timeoutMs = 5000);

    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 20);

    static void logMessage(const QString& message);

private:
    static QTemporaryDir* tempDir_;
};

// Template implementations
template<typename T>
T TestUtils::waitForFuture(QFuture<T> future, int timeoutMs) {
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    QFutureWatcher<T> watcher;
    QObject::connect(&watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    watcher.setFuture(future);
    timer.start(timeoutMs);

    if (!future.isFinished()) {
        loop.exec();
    }

    if (!future.isFinished()) {
        logMessage(QString("waitForFuture timeout after %1ms").arg(timeoutMs));
        static_assert(std::is_default_constructible_v<T>, "T must be default constructible for timeout case");
        return T{};
    }

    return future.result();
}

} // namespace Test
} // namespace WordFinder

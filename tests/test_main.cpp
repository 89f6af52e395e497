#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "core/common/Logger.hpp"

// Test suites live in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestWavFormat(int argc, char** argv);
extern int runTestModelStore(int argc, char** argv);
extern int runTestResultCache(int argc, char** argv);
extern int runTestTranscriptionEngine(int argc, char** argv);
extern int runTestJobQueue(int argc, char** argv);
extern int runTestPipeline(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    WhisperKit::Logger::instance().initialize("whisperkit-tests.log", WhisperKit::Logger::Level::Debug);
    WhisperKit::Test::TestUtils::initializeTestEnvironment();

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
        {"WavFormat", runTestWavFormat},
        {"ModelStore", runTestModelStore},
        {"ResultCache", runTestResultCache},
        {"TranscriptionEngine", runTestTranscriptionEngine},
        {"JobQueue", runTestJobQueue},
        {"Pipeline", runTestPipeline}
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

    WhisperKit::Test::TestUtils::cleanupTestEnvironment();

    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}

#include "TestUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QRandomGenerator>
#include <QtCore/QtEndian>
#include <QtCore/QtMath>

#include "core/media/WavFormat.hpp"

namespace WhisperKit {
namespace Test {

QTemporaryDir* TestUtils::tempDir_ = nullptr;

void TestUtils::initializeTestEnvironment() {
    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }
    qputenv("WHISPERKIT_TEST_MODE", "1");
}

void TestUtils::cleanupTestEnvironment() {
    delete tempDir_;
    tempDir_ = nullptr;
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    const QString dirName = QString("%1_%2_%3")
                                .arg(prefix)
                                .arg(QDateTime::currentMSecsSinceEpoch())
                                .arg(QRandomGenerator::global()->generate());
    const QString fullPath = tempDir_->path() + "/" + dirName;
    if (!QDir().mkpath(fullPath)) {
        return QString();
    }
    return fullPath;
}

QByteArray TestUtils::makeTonePcm(int durationMs, quint32 sampleRate, quint16 channels, double frequencyHz) {
    const qint64 frames = qint64(sampleRate) * durationMs / 1000;
    QByteArray pcm;
    pcm.resize(static_cast<int>(frames * channels * 2));
    uchar* out = reinterpret_cast<uchar*>(pcm.data());

    for (qint64 frame = 0; frame < frames; ++frame) {
        const double t = static_cast<double>(frame) / sampleRate;
        const auto sample = static_cast<qint16>(qSin(2.0 * M_PI * frequencyHz * t) * 8000.0);
        for (quint16 channel = 0; channel < channels; ++channel) {
            qToLittleEndian<qint16>(sample, out);
            out += 2;
        }
    }
    return pcm;
}

QString TestUtils::writeWav(const QString& directory, const QString& fileName, int durationMs,
                            quint32 sampleRate, quint16 channels) {
    const QString path = QDir(directory).filePath(fileName);
    auto written = WavFormat::writePcm(path, makeTonePcm(durationMs, sampleRate, channels), sampleRate, channels);
    return written.hasValue() ? path : QString();
}

QString TestUtils::writeFile(const QString& directory, const QString& fileName, const QByteArray& content) {
    const QString path = QDir(directory).filePath(fileName);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(content) != content.size()) {
        return QString();
    }
    return path;
}

QByteArray TestUtils::makeModelBytes(int size, const QByteArray& magic) {
    QByteArray bytes = magic.left(size);
    while (bytes.size() < size) {
        bytes.append(static_cast<char>(bytes.size() % 251));
    }
    return bytes;
}

bool TestUtils::waitForCondition(const std::function<bool()>& condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }
    return condition();
}

} // namespace Test
} // namespace WhisperKit

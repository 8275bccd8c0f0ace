#include "RecordedSessionPlayer.h"
#include "RunSessionOptions.h"
#include "TestSignals.h"
#include "TuningEngine.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gtest/gtest.h>
#include <sndfile.h>

#include <vector>

namespace {

constexpr int kSampleRate = 22050;
constexpr double kTakeSeconds = 3.0;

bool writeWav(const QString& path, const std::vector<float>& interleaved, int sampleRate, int channels = 1) {
    SF_INFO info {};
    info.samplerate = sampleRate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    const QByteArray encoded = QFile::encodeName(path);
    SNDFILE* file = sf_open(encoded.constData(), SFM_WRITE, &info);
    if (!file)
        return false;
    const sf_count_t frames = static_cast<sf_count_t>(interleaved.size()) / channels;
    const sf_count_t written = sf_writef_float(file, interleaved.data(), frames);
    sf_close(file);
    return written == frames;
}

std::vector<float> take(double hz, int sampleRate = kSampleRate) {
    return testsignals::sine(hz, sampleRate, static_cast<int>(kTakeSeconds * sampleRate), 0.5f);
}

RunSessionOptions optionsFor(const QString& path) {
    RunSessionOptions options;
    options.sessionPath = path.toStdString();
    options.tickMs = 100;
    options.frameSize = 2048;
    return options;
}

struct Recorder {
    std::vector<int> confirmed;
    int statuses = 0;
    bool completed = false;
    bool finished = false;
    QStringList errors;

    void attach(RecordedSessionPlayer& player) {
        QObject::connect(&player, &RecordedSessionPlayer::statusUpdated, [this](const TuningStatus&) { ++statuses; });
        QObject::connect(&player, &RecordedSessionPlayer::stringConfirmed, [this](int index, qint64) { confirmed.push_back(index); });
        QObject::connect(&player, &RecordedSessionPlayer::sessionCompleted, [this]() { completed = true; });
        QObject::connect(&player, &RecordedSessionPlayer::playbackFinished, [this]() { finished = true; });
        QObject::connect(&player, &RecordedSessionPlayer::playbackError, [this](const QString& e) { errors.append(e); });
    }
};

}

TEST(RecordedSessionPlayer, SixTakesTuneEveryString) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto& targets = standardTuning();
    for (int i = 0; i < kNumStrings; ++i) {
        const QString name = QStringLiteral("%1_string.wav").arg(i + 1);
        ASSERT_TRUE(writeWav(dir.filePath(name), take(targets[static_cast<std::size_t>(i)].frequencyHz), kSampleRate));
    }

    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);

    ASSERT_TRUE(player.loadSession(optionsFor(dir.path())));
    EXPECT_EQ(player.takeFiles().size(), kNumStrings);
    EXPECT_EQ(player.sampleRate(), kSampleRate);
    EXPECT_NEAR(player.durationSec(), kNumStrings * kTakeSeconds, 1e-6);

    EXPECT_TRUE(player.run());
    EXPECT_TRUE(recorder.errors.isEmpty()) << recorder.errors.join(", ").toStdString();
    EXPECT_TRUE(recorder.completed);
    EXPECT_TRUE(recorder.finished);
    EXPECT_EQ(recorder.confirmed, (std::vector<int>{0, 1, 2, 3, 4, 5}));
    EXPECT_TRUE(engine.stateMachine().session().allTuned);
    EXPECT_LT(player.positionSec(), player.durationSec());
}

TEST(RecordedSessionPlayer, MetadataOrdersTakes) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto& targets = standardTuning();
    // File names sort opposite to the tuning order.
    const QStringList names {QStringLiteral("f.wav"), QStringLiteral("e.wav"), QStringLiteral("d.wav"),
                             QStringLiteral("c.wav"), QStringLiteral("b.wav"), QStringLiteral("a.wav")};
    QJsonArray takes;
    for (int i = 0; i < kNumStrings; ++i) {
        ASSERT_TRUE(writeWav(dir.filePath(names[i]), take(targets[static_cast<std::size_t>(i)].frequencyHz), kSampleRate));
        takes.append(names[i]);
    }
    QJsonObject metadata;
    metadata.insert("takes", takes);
    QFile metadataFile(dir.filePath(QStringLiteral("metadata.json")));
    ASSERT_TRUE(metadataFile.open(QIODevice::WriteOnly));
    metadataFile.write(QJsonDocument(metadata).toJson());
    metadataFile.close();

    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);
    ASSERT_TRUE(player.loadSession(optionsFor(dir.path())));
    EXPECT_TRUE(player.takeFiles().first().endsWith(QStringLiteral("f.wav")));
    EXPECT_TRUE(player.run());
    EXPECT_TRUE(recorder.completed);
    EXPECT_EQ(recorder.confirmed.size(), 6u);
}

TEST(RecordedSessionPlayer, StereoTakeIsDownmixed) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto mono = take(82.41);
    std::vector<float> stereo;
    stereo.reserve(mono.size() * 2);
    for (float v : mono) {
        stereo.push_back(v);
        stereo.push_back(v);
    }
    const QString path = dir.filePath(QStringLiteral("lowE.wav"));
    ASSERT_TRUE(writeWav(path, stereo, kSampleRate, 2));

    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);
    ASSERT_TRUE(player.loadSession(optionsFor(path)));
    EXPECT_NEAR(player.durationSec(), kTakeSeconds, 1e-6);
    EXPECT_TRUE(player.run());
    EXPECT_EQ(recorder.confirmed, (std::vector<int>{0}));
    EXPECT_FALSE(recorder.completed);
    EXPECT_TRUE(recorder.finished);
}

TEST(RecordedSessionPlayer, SampleRateMismatchFailsToLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(writeWav(dir.filePath(QStringLiteral("a.wav")), take(82.41), kSampleRate));
    ASSERT_TRUE(writeWav(dir.filePath(QStringLiteral("b.wav")), take(110.0, 48000), 48000));

    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);
    EXPECT_FALSE(player.loadSession(optionsFor(dir.path())));
    EXPECT_FALSE(player.isReady());
    ASSERT_EQ(recorder.errors.size(), 1);
    EXPECT_TRUE(recorder.errors.first().contains(QStringLiteral("Sample rate mismatch")));
    EXPECT_FALSE(player.run());
}

TEST(RecordedSessionPlayer, MissingSessionFailsToLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);

    EXPECT_FALSE(player.loadSession(optionsFor(dir.filePath(QStringLiteral("nope.wav")))));
    EXPECT_FALSE(player.loadSession(optionsFor(dir.path())));
    ASSERT_EQ(recorder.errors.size(), 2);
    EXPECT_TRUE(recorder.errors.last().contains(QStringLiteral("No WAV takes")));

    RunSessionOptions badTick = optionsFor(dir.path());
    badTick.tickMs = 0;
    EXPECT_FALSE(player.loadSession(badTick));
}

TEST(RecordedSessionPlayer, StopEndsPlaybackEarly) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("lowE.wav"));
    ASSERT_TRUE(writeWav(path, take(82.41), kSampleRate));

    TuningEngine engine(makeDefaultTunerConfig());
    RecordedSessionPlayer player(&engine);
    Recorder recorder;
    recorder.attach(player);
    QObject::connect(&player, &RecordedSessionPlayer::statusUpdated, &player, [&player](const TuningStatus& status) {
        if (status.time.count() >= 300)
            player.stop();
    });
    ASSERT_TRUE(player.loadSession(optionsFor(path)));
    EXPECT_TRUE(player.run());
    EXPECT_TRUE(recorder.finished);
    EXPECT_EQ(recorder.statuses, 3);
    EXPECT_TRUE(recorder.confirmed.empty());
}

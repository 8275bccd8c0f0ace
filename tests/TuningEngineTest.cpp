#include "TuningEngine.h"
#include "TestSignals.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {
constexpr int kSampleRate = 44100;
constexpr int kFrame = 4096;
}

TEST(TuningEngine, RejectsMalformedFramesWithMessage) {
    TuningEngine engine(makeDefaultTunerConfig());
    const auto frame = testsignals::sine(82.41, kSampleRate, kFrame);
    TuningStatus status;
    std::string error;

    EXPECT_FALSE(engine.processTick(nullptr, kFrame, kSampleRate, 0ms, status, &error));
    EXPECT_NE(error.find("empty"), std::string::npos);

    error.clear();
    EXPECT_FALSE(engine.processTick(frame.data(), 0, kSampleRate, 0ms, status, &error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(engine.processTick(frame.data(), kFrame, 0, 0ms, status, &error));
    EXPECT_NE(error.find("sample rate"), std::string::npos);

    // A bad frame does not touch the session.
    EXPECT_EQ(engine.stateMachine().phase(), TuningPhase::Listening);
    EXPECT_FALSE(engine.stateMachine().session().smoothedHz.has_value());
}

TEST(TuningEngine, SilenceReportsNoPitch) {
    TuningEngine engine(makeDefaultTunerConfig());
    const std::vector<float> silence(kFrame, 0.f);
    TuningStatus status;
    ASSERT_TRUE(engine.processTick(silence.data(), kFrame, kSampleRate, 0ms, status));
    EXPECT_FALSE(status.smoothedHz.has_value());
    EXPECT_FALSE(status.cents.has_value());
    EXPECT_FALSE(status.inTolerance);
    EXPECT_TRUE(status.detectedNote.empty());
    EXPECT_FALSE(engine.lastEstimate().has_value());
}

TEST(TuningEngine, SilenceClearsSmoothing) {
    TuningEngine engine(makeDefaultTunerConfig());
    const auto tone = testsignals::sine(82.41, kSampleRate, kFrame);
    const std::vector<float> silence(kFrame, 0.f);
    TuningStatus status;
    ASSERT_TRUE(engine.processTick(tone.data(), kFrame, kSampleRate, 0ms, status));
    ASSERT_TRUE(status.smoothedHz.has_value());
    ASSERT_TRUE(engine.processTick(silence.data(), kFrame, kSampleRate, 100ms, status));
    EXPECT_FALSE(status.smoothedHz.has_value());
    EXPECT_EQ(status.phase, TuningPhase::Listening);
}

TEST(TuningEngine, SustainedLowEConfirmsFirstString) {
    TuningEngine engine(makeDefaultTunerConfig());
    const auto tone = testsignals::sine(82.41, kSampleRate, kFrame);
    TuningStatus status;
    bool confirmed = false;
    for (int tick = 0; tick < 20 && !confirmed; ++tick) {
        ASSERT_TRUE(engine.processTick(tone.data(), kFrame, kSampleRate, TickTime(tick * 100), status));
        if (tick == 0) {
            ASSERT_TRUE(status.cents.has_value());
            EXPECT_LT(std::abs(*status.cents), 8.0);
            EXPECT_EQ(status.detectedNote, "E2");
        }
        confirmed = status.confirmedThisTick;
    }
    EXPECT_TRUE(confirmed);
    EXPECT_EQ(status.targetIndex, 1);
    EXPECT_EQ(status.target.stringNumber, 5);
}

TEST(TuningEngine, ResetReturnsToFirstString) {
    TuningEngine engine(makeDefaultTunerConfig());
    const auto tone = testsignals::sine(82.41, kSampleRate, kFrame);
    TuningStatus status;
    ASSERT_TRUE(engine.processTick(tone.data(), kFrame, kSampleRate, 0ms, status));
    ASSERT_TRUE(engine.processTick(tone.data(), kFrame, kSampleRate, 900ms, status));
    ASSERT_EQ(engine.stateMachine().session().targetIndex, 1);

    engine.reset();
    EXPECT_EQ(engine.stateMachine().session().targetIndex, 0);
    EXPECT_FALSE(engine.stateMachine().session().smoothedHz.has_value());
    EXPECT_FALSE(engine.lastEstimate().has_value());
}

#include "SignalGate.h"
#include "TestSignals.h"

#include <gtest/gtest.h>

#include <vector>

TEST(SignalGate, RejectsSilence) {
    const SignalGate gate(0.01f);
    const std::vector<float> silence(4096, 0.f);
    EXPECT_FALSE(gate.admit(silence.data(), static_cast<int>(silence.size())));
    EXPECT_FLOAT_EQ(gate.measure(silence.data(), static_cast<int>(silence.size())), 0.f);
}

TEST(SignalGate, AdmitsPluckedLevelSine) {
    const SignalGate gate(0.01f);
    const auto frame = testsignals::sine(110.0, 44100, 4096, 0.5f);
    EXPECT_TRUE(gate.admit(frame.data(), static_cast<int>(frame.size())));
    EXPECT_NEAR(gate.measure(frame.data(), static_cast<int>(frame.size())), 0.5f / std::sqrt(2.f), 0.01f);
}

TEST(SignalGate, FloorIsExclusive) {
    const std::vector<float> dc(256, 0.25f);
    EXPECT_FALSE(SignalGate(0.25f).admit(dc.data(), static_cast<int>(dc.size())));
    EXPECT_TRUE(SignalGate(0.2499f).admit(dc.data(), static_cast<int>(dc.size())));
}

TEST(SignalGate, RejectsEmptyFrame) {
    const SignalGate gate(0.01f);
    EXPECT_FALSE(gate.admit(nullptr, 128));
    const float one = 1.f;
    EXPECT_FALSE(gate.admit(&one, 0));
}

// ============================================================================
// test_tuning_controller.cpp
// ============================================================================
#include "fake_sample_source.hpp"
#include "scan_errors.hpp"
#include "tuning_controller.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>

namespace {

DeviceConfig default_config() {
    DeviceConfig c;
    c.center_freq_hz = 145.0e6;
    c.sample_rate_sps = 2.4e6;
    c.fft_size = 1024;
    return c;
}

class TuningControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tuning_ = std::make_unique<TuningController>(source_, default_config());
        tuning_->apply_initial();
    }

    FakeSampleSource source_;
    std::unique_ptr<TuningController> tuning_;
};

} // namespace

TEST_F(TuningControllerTest, InitialConfigReachesSource) {
    const auto calls = source_.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_DOUBLE_EQ(calls[0].center_freq_hz, 145.0e6);
    EXPECT_DOUBLE_EQ(calls[0].sample_rate_sps, 2.4e6);
    EXPECT_TRUE(calls[0].gain.automatic);
    EXPECT_EQ(tuning_->snapshot().generation, 1u);
}

TEST_F(TuningControllerTest, CenterFrequencyAppliedAndVisible) {
    EXPECT_DOUBLE_EQ(tuning_->set_center_frequency(433.92e6), 433.92e6);
    EXPECT_DOUBLE_EQ(tuning_->current_config().center_freq_hz, 433.92e6);
    EXPECT_DOUBLE_EQ(source_.calls().back().center_freq_hz, 433.92e6);
}

TEST_F(TuningControllerTest, ClampPolicyClampsToBandEdge) {
    // Lowest center keeps the 2.4 MHz span above 24 MHz
    EXPECT_DOUBLE_EQ(tuning_->set_center_frequency(10.0e6), 25.2e6);
    EXPECT_DOUBLE_EQ(tuning_->current_config().center_freq_hz, 25.2e6);

    EXPECT_DOUBLE_EQ(tuning_->set_center_frequency(2.0e9), 1764.8e6);
}

TEST_F(TuningControllerTest, RejectPolicyKeepsPreviousFrequency) {
    tuning_->set_range_policy(RangePolicy::Reject);
    EXPECT_EQ(tuning_->range_policy(), RangePolicy::Reject);

    EXPECT_THROW(tuning_->set_center_frequency(10.0e6), OutOfRangeError);
    EXPECT_DOUBLE_EQ(tuning_->current_config().center_freq_hz, 145.0e6);
    EXPECT_EQ(source_.calls().size(), 1u);
}

TEST_F(TuningControllerTest, OffsetShiftsHardwareFrequency) {
    EXPECT_DOUBLE_EQ(tuning_->set_frequency_offset(125.0e6), 145.0e6);
    EXPECT_DOUBLE_EQ(source_.calls().back().center_freq_hz, 270.0e6);

    // Below the tuner range on its own, fine with the upconverter offset
    EXPECT_DOUBLE_EQ(tuning_->set_center_frequency(7.1e6), 7.1e6);
    EXPECT_DOUBLE_EQ(source_.calls().back().center_freq_hz, 132.1e6);
    EXPECT_DOUBLE_EQ(tuning_->current_config().hardware_freq_hz(), 132.1e6);
}

TEST_F(TuningControllerTest, ManualGainMustBeSupportedStep) {
    tuning_->set_gain(GainSetting::manual(28.0));
    EXPECT_FALSE(tuning_->current_config().gain.automatic);
    EXPECT_DOUBLE_EQ(tuning_->current_config().gain.value_db, 28.0);

    try {
        tuning_->set_gain(GainSetting::manual(27.0));
        FAIL() << "expected InvalidGainError";
    } catch (const InvalidGainError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidGain);
        EXPECT_FALSE(e.recoverable());
    }
    EXPECT_DOUBLE_EQ(tuning_->current_config().gain.value_db, 28.0);
}

TEST_F(TuningControllerTest, GainSnapsToNearbyStep) {
    tuning_->set_gain(GainSetting::manual(49.62));
    EXPECT_DOUBLE_EQ(tuning_->current_config().gain.value_db, 49.6);
}

TEST_F(TuningControllerTest, AutoGain) {
    tuning_->set_gain(GainSetting::manual(0.0));
    tuning_->set_gain(GainSetting::make_auto());
    EXPECT_TRUE(tuning_->current_config().gain.automatic);
    EXPECT_TRUE(source_.calls().back().gain.automatic);
    EXPECT_EQ(tuning_->current_config().gain.to_string(), "AUTO");
}

TEST_F(TuningControllerTest, SampleRateValidatedAgainstRanges) {
    EXPECT_THROW(tuning_->set_sample_rate(500.0e3), OutOfRangeError);
    EXPECT_THROW(tuning_->set_sample_rate(3.3e6), OutOfRangeError);
    EXPECT_DOUBLE_EQ(tuning_->current_config().sample_rate_sps, 2.4e6);

    tuning_->set_sample_rate(250.0e3);
    EXPECT_DOUBLE_EQ(tuning_->current_config().sample_rate_sps, 250.0e3);
    EXPECT_DOUBLE_EQ(source_.calls().back().sample_rate_sps, 250.0e3);
}

TEST_F(TuningControllerTest, FftSizeValidatedWithoutTouchingDevice) {
    EXPECT_THROW(tuning_->set_fft_size(1000), OutOfRangeError);
    EXPECT_THROW(tuning_->set_fft_size(8), OutOfRangeError);
    EXPECT_THROW(tuning_->set_fft_size(131072), OutOfRangeError);

    tuning_->set_fft_size(2048);
    EXPECT_EQ(tuning_->current_config().fft_size, 2048u);
    EXPECT_EQ(source_.calls().size(), 1u);
}

TEST_F(TuningControllerTest, AveragingFactorValidated) {
    EXPECT_THROW(tuning_->set_averaging(AveragingMode::Exponential, 1.0), OutOfRangeError);
    EXPECT_THROW(tuning_->set_averaging(AveragingMode::Block, 0.0), OutOfRangeError);

    tuning_->set_averaging(AveragingMode::Block, 8.0);
    EXPECT_EQ(tuning_->current_config().averaging, AveragingMode::Block);
    EXPECT_DOUBLE_EQ(tuning_->current_config().averaging_factor, 8.0);
}

TEST_F(TuningControllerTest, DeviceFailureKeepsPreviousConfig) {
    const uint64_t generation = tuning_->snapshot().generation;
    source_.set_fail_configure(true);

    EXPECT_THROW(tuning_->set_center_frequency(433.0e6), DeviceFailureError);
    EXPECT_DOUBLE_EQ(tuning_->current_config().center_freq_hz, 145.0e6);
    EXPECT_EQ(tuning_->snapshot().generation, generation);
}

TEST_F(TuningControllerTest, ListenersSeeGeometryChanges) {
    std::vector<bool> geometry;
    std::vector<uint64_t> generations;
    tuning_->add_listener([&](const ConfigSnapshot& snap, bool changed) {
        geometry.push_back(changed);
        generations.push_back(snap.generation);
    });

    tuning_->set_center_frequency(146.0e6);
    tuning_->set_gain(GainSetting::manual(20.7));
    tuning_->set_fft_size(512);
    tuning_->set_sample_rate(1.2e6);

    ASSERT_EQ(geometry.size(), 4u);
    EXPECT_FALSE(geometry[0]);
    EXPECT_FALSE(geometry[1]);
    EXPECT_TRUE(geometry[2]);
    EXPECT_TRUE(geometry[3]);
    EXPECT_LT(generations[0], generations[3]);
}

TEST_F(TuningControllerTest, ReadBlockReportsConfigInForce) {
    tuning_->set_fft_size(256);
    ConfigSnapshot snap;
    SampleBlock block = tuning_->read_block(snap, std::chrono::milliseconds(100));
    EXPECT_EQ(block.size(), 256u);
    EXPECT_EQ(snap.config.fft_size, 256u);
    EXPECT_EQ(snap.generation, tuning_->snapshot().generation);
}

TEST_F(TuningControllerTest, CommitsRateTheSourceApplied) {
    // Hardware that coerces the requested rate to the nearest divider
    source_.set_applied_rate(2.4000048e6);
    tuning_->set_sample_rate(2.4e6);

    EXPECT_DOUBLE_EQ(source_.calls().back().sample_rate_sps, 2.4e6);
    EXPECT_DOUBLE_EQ(tuning_->current_config().sample_rate_sps, 2.4000048e6);
    EXPECT_DOUBLE_EQ(tuning_->current_config().center_freq_hz, 145.0e6);
}

TEST_F(TuningControllerTest, FftSizeChangeDoesNotWaitForRead) {
    source_.set_read_delay(std::chrono::milliseconds(400));
    ConfigSnapshot snap;
    std::thread reader([&] {
        tuning_->read_block(snap, std::chrono::milliseconds(1000));
    });
    while (source_.reads() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    const auto before = std::chrono::steady_clock::now();
    tuning_->set_fft_size(512);
    const auto waited = std::chrono::steady_clock::now() - before;
    reader.join();

    EXPECT_LT(waited, std::chrono::milliseconds(200));
    EXPECT_EQ(snap.config.fft_size, 1024u);
    EXPECT_EQ(tuning_->current_config().fft_size, 512u);
}

TEST(TuningControllerInitTest, InvalidInitialConfigRejected) {
    FakeSampleSource source;
    DeviceConfig bad = default_config();
    bad.fft_size = 100;
    TuningController fft_bad(source, bad);
    EXPECT_THROW(fft_bad.apply_initial(), OutOfRangeError);

    bad = default_config();
    bad.gain = GainSetting::manual(13.0);
    TuningController gain_bad(source, bad);
    EXPECT_THROW(gain_bad.apply_initial(), InvalidGainError);

    bad = default_config();
    bad.center_freq_hz = 5.0e6;
    TuningController reject(source, bad, RangePolicy::Reject);
    EXPECT_THROW(reject.apply_initial(), OutOfRangeError);
    EXPECT_TRUE(source.calls().empty());
}

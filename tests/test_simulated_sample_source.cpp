// ============================================================================
// test_simulated_sample_source.cpp
// ============================================================================
#include "scan_errors.hpp"
#include "simulated_sample_source.hpp"
#include "spectrum_transform.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace std::chrono_literals;

TEST(SimulatedSampleSourceTest, ReportsRtlSdrCapabilities) {
    SimulatedSampleSource source;
    const SourceCapabilities caps = source.capabilities();
    EXPECT_DOUBLE_EQ(caps.tuning_range.start, 24.0e6);
    EXPECT_DOUBLE_EQ(caps.tuning_range.stop, 1766.0e6);
    EXPECT_TRUE(caps.supports_sample_rate(2.4e6));
    EXPECT_TRUE(caps.supports_sample_rate(250.0e3));
    EXPECT_FALSE(caps.supports_sample_rate(500.0e3));
    EXPECT_TRUE(caps.supports_gain(28.0));
    EXPECT_FALSE(caps.supports_gain(27.0));
    EXPECT_EQ(source.get_name(), "simulated");
}

TEST(SimulatedSampleSourceTest, ReadBeforeConfigureFails) {
    SimulatedSampleSource source({}, 0.0f, false);
    EXPECT_THROW(source.read_block(256, 100ms), DeviceFailureError);
}

TEST(SimulatedSampleSourceTest, ToneAppearsAtItsOffset) {
    SimulatedSampleSource source({SimulatedTone{145.25e6, 1.0f}}, 0.0f, false);
    source.configure(145.0e6, 2.0e6, GainSetting::make_auto());

    const SampleBlock block = source.read_block(1024, 100ms);
    ASSERT_EQ(block.samples.size(), 1024u);
    EXPECT_DOUBLE_EQ(block.center_freq_hz, 145.0e6);
    EXPECT_DOUBLE_EQ(block.sample_rate_sps, 2.0e6);

    DeviceConfig cfg;
    cfg.center_freq_hz = 145.0e6;
    cfg.sample_rate_sps = 2.0e6;
    cfg.fft_size = 1024;
    SpectrumTransform transform;
    SpectrumRow row;
    ASSERT_TRUE(transform.process(block, cfg, row));

    const size_t peak = static_cast<size_t>(
        std::max_element(row.bins_db.begin(), row.bins_db.end()) - row.bins_db.begin());
    EXPECT_EQ(peak, 640u);
    EXPECT_NEAR(row.bins_db[peak], 0.0f, 0.1f);
}

TEST(SimulatedSampleSourceTest, ManualGainScalesSamples) {
    SimulatedSampleSource source({SimulatedTone{100.0e6, 1.0f}}, 0.0f, false);
    source.configure(100.0e6, 2.4e6, GainSetting::manual(20.0));

    const SampleBlock block = source.read_block(16, 100ms);
    // Tone at the center is a constant phasor
    EXPECT_NEAR(std::abs(block.samples[0]), 10.0f, 1e-3f);
    EXPECT_NEAR(std::abs(block.samples[15]), 10.0f, 1e-3f);
}

TEST(SimulatedSampleSourceTest, RealtimePacingTimesOut) {
    SimulatedSampleSource source({}, 0.0f, true);
    source.configure(100.0e6, 250.0e3, GainSetting::make_auto());
    // 65536 samples at 250 ksps take about 260 ms
    EXPECT_THROW(source.read_block(65536, 20ms), TimeoutError);
}

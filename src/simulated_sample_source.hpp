// ============================================================================
// simulated_sample_source.hpp - Synthetic receiver: tones plus Gaussian noise
// ============================================================================
#ifndef SIMULATED_SAMPLE_SOURCE_HPP
#define SIMULATED_SAMPLE_SOURCE_HPP

#include "sample_source.hpp"
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

struct SimulatedTone {
    double freq_hz{0.0};       // absolute RF frequency
    float amplitude{1.0f};     // linear, 1.0 = full scale
};

// ============================================================================
// SimulatedSampleSource
// ============================================================================
// Reports RTL-SDR capabilities (24 - 1766 MHz, 0.225 - 0.3 / 0.9 - 3.2 Msps,
// R820T gain table). Tones further than rate/2 from the center alias back
// into the span.
class SimulatedSampleSource : public ISampleSource {
public:
    explicit SimulatedSampleSource(std::vector<SimulatedTone> tones = {},
                                   float noise_rms = 0.01f,
                                   bool realtime = true,
                                   uint32_t seed = 1);

    static SourceCapabilities rtlsdr_capabilities();

    SourceCapabilities capabilities() const override { return caps_; }
    AppliedTuning configure(double center_freq_hz,
                            double sample_rate_sps,
                            const GainSetting& gain) override;
    SampleBlock read_block(size_t num_samples,
                           std::chrono::milliseconds timeout) override;
    std::string get_name() const override { return "simulated"; }

    void set_tones(std::vector<SimulatedTone> tones);

private:
    SourceCapabilities caps_;
    std::mutex mutex_;
    std::vector<SimulatedTone> tones_;
    float noise_rms_;
    bool realtime_;
    std::mt19937 gen_;
    std::normal_distribution<float> noise_;

    double center_freq_{0.0};
    double sample_rate_{0.0};
    float gain_linear_{1.0f};
    uint64_t sample_index_{0};   // keeps tone phase continuous across blocks
    Clock::time_point next_block_at_{};
};

#endif // SIMULATED_SAMPLE_SOURCE_HPP

// ============================================================================
// simulated_sample_source.cpp - Synthetic IQ generation
// ============================================================================
#include "simulated_sample_source.hpp"
#include "scan_errors.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

SimulatedSampleSource::SimulatedSampleSource(std::vector<SimulatedTone> tones,
                                             float noise_rms,
                                             bool realtime,
                                             uint32_t seed)
    : caps_(rtlsdr_capabilities()),
      tones_(std::move(tones)),
      noise_rms_(noise_rms),
      realtime_(realtime),
      gen_(seed),
      noise_(0.0f, 1.0f) {}

SourceCapabilities SimulatedSampleSource::rtlsdr_capabilities() {
    SourceCapabilities caps;
    caps.tuning_range = FreqRange{24.0e6, 1766.0e6};
    caps.sample_rates = {FreqRange{225001.0, 300000.0}, FreqRange{900001.0, 3200000.0}};
    caps.gain_steps_db = {0.0, 0.9, 1.4, 2.7, 3.7, 7.7, 8.7, 12.5, 14.4, 15.7,
                          16.6, 19.7, 20.7, 22.9, 25.4, 28.0, 29.7, 32.8, 33.8,
                          36.4, 37.2, 38.6, 40.2, 42.1, 43.4, 43.9, 44.5, 48.0, 49.6};
    return caps;
}

void SimulatedSampleSource::set_tones(std::vector<SimulatedTone> tones) {
    std::lock_guard<std::mutex> lock(mutex_);
    tones_ = std::move(tones);
}

AppliedTuning SimulatedSampleSource::configure(double center_freq_hz,
                                               double sample_rate_sps,
                                               const GainSetting& gain) {
    std::lock_guard<std::mutex> lock(mutex_);
    center_freq_ = center_freq_hz;
    sample_rate_ = sample_rate_sps;
    // AGC keeps the simulated front end at unity
    gain_linear_ = gain.automatic ? 1.0f
                                  : static_cast<float>(std::pow(10.0, gain.value_db / 20.0));
    next_block_at_ = Clock::now();
    return AppliedTuning{center_freq_, sample_rate_};
}

SampleBlock SimulatedSampleSource::read_block(size_t num_samples,
                                              std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sample_rate_ <= 0.0) {
        throw DeviceFailureError("Simulated source read before configure()");
    }

    // Pace blocks at the configured sample rate
    if (realtime_) {
        auto block_time = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(num_samples / sample_rate_));
        auto ready_at = next_block_at_ + block_time;
        auto now = Clock::now();
        if (ready_at - now > timeout) {
            std::this_thread::sleep_for(timeout);
            throw TimeoutError("Simulated block not ready within timeout");
        }
        if (ready_at > now) std::this_thread::sleep_until(ready_at);
        next_block_at_ = std::max(ready_at, now);
    }

    SampleBlock block;
    block.center_freq_hz = center_freq_;
    block.sample_rate_sps = sample_rate_;
    block.samples.resize(num_samples);

    for (size_t n = 0; n < num_samples; n++) {
        const double t = static_cast<double>(sample_index_ + n) / sample_rate_;
        std::complex<double> acc(0.0, 0.0);
        for (const auto& tone : tones_) {
            const double phase = 2.0 * M_PI * (tone.freq_hz - center_freq_) * t;
            acc += std::polar(static_cast<double>(tone.amplitude), phase);
        }
        std::complex<float> s(static_cast<float>(acc.real()), static_cast<float>(acc.imag()));
        if (noise_rms_ > 0.0f) {
            // Split the noise power evenly between I and Q
            const float sigma = noise_rms_ / std::sqrt(2.0f);
            s += sigma * std::complex<float>(noise_(gen_), noise_(gen_));
        }
        block.samples[n] = s * gain_linear_;
    }
    sample_index_ += num_samples;
    block.captured_at = Clock::now();
    return block;
}

// ============================================================================
// spectrum_types.hpp - Sample blocks, spectrum rows and device configuration
// ============================================================================
#ifndef SPECTRUM_TYPES_HPP
#define SPECTRUM_TYPES_HPP

#include <chrono>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

// ============================================================================
// SampleBlock - one fixed-size read of IQ samples from the receiver
// ============================================================================
struct SampleBlock {
    std::vector<std::complex<float>> samples;
    double center_freq_hz{0.0};   // tuned (hardware) frequency, offset included
    double sample_rate_sps{0.0};
    Clock::time_point captured_at{};

    size_t size() const { return samples.size(); }
};

// ============================================================================
// SpectrumRow - DC-centered power spectrum, bins in ascending frequency
// ============================================================================
struct SpectrumRow {
    std::vector<float> bins_db;
    double center_freq_hz{0.0};   // nominal center, offset excluded
    double freq_offset_hz{0.0};
    double span_hz{0.0};          // equals the sample rate
    Clock::time_point captured_at{};
    uint64_t sequence{0};
    int scan_step{-1};            // -1 when not produced by a sweep

    size_t size() const { return bins_db.size(); }

    // Absolute frequency of bin i: center + offset - span/2 + i * span/N
    double bin_frequency(size_t i) const;
    size_t bin_for_frequency(double freq_hz) const;
};

// ============================================================================
// Gain - fixed discrete step in dB, or automatic gain control
// ============================================================================
struct GainSetting {
    bool automatic{true};
    double value_db{0.0};

    static GainSetting make_auto() { return GainSetting{true, 0.0}; }
    static GainSetting manual(double db) { return GainSetting{false, db}; }

    std::string to_string() const;
    bool operator==(const GainSetting& other) const;
    bool operator!=(const GainSetting& other) const { return !(*this == other); }
};

enum class AveragingMode {
    None,
    Exponential,   // avg = a*avg + (1-a)*new in linear power, factor = a
    Block          // mean of every M blocks, factor = M
};

enum class WindowType {
    Rectangular,
    Hann,
    Hamming,
    Blackman
};

std::string averaging_mode_to_string(AveragingMode mode);
AveragingMode string_to_averaging_mode(const std::string& str);
std::string window_type_to_string(WindowType type);
WindowType string_to_window_type(const std::string& str);

// ============================================================================
// DeviceConfig - the single shared acquisition configuration
// ============================================================================
struct DeviceConfig {
    double center_freq_hz{145.0e6};
    double freq_offset_hz{0.0};
    double sample_rate_sps{2.4e6};
    GainSetting gain{};
    size_t fft_size{1024};
    AveragingMode averaging{AveragingMode::None};
    double averaging_factor{0.0};

    // Frequency the hardware is actually tuned to
    double hardware_freq_hz() const { return center_freq_hz + freq_offset_hz; }

    // Rows produced under a and b can share a waterfall
    static bool same_geometry(const DeviceConfig& a, const DeviceConfig& b) {
        return a.fft_size == b.fft_size && a.sample_rate_sps == b.sample_rate_sps;
    }
};

// Inclusive frequency interval in Hz
struct FreqRange {
    double start{0.0};
    double stop{0.0};

    bool contains(double v) const { return v >= start && v <= stop; }
    double width() const { return stop - start; }
};

#endif // SPECTRUM_TYPES_HPP

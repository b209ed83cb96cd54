// ============================================================================
// sample_source.hpp - Abstract receiver the acquisition core pulls blocks from
// ============================================================================
#ifndef SAMPLE_SOURCE_HPP
#define SAMPLE_SOURCE_HPP

#include "spectrum_types.hpp"
#include <chrono>
#include <string>
#include <vector>

// ============================================================================
// Hardware capabilities reported by a source
// ============================================================================
struct SourceCapabilities {
    FreqRange tuning_range{24.0e6, 1766.0e6};   // hardware tunable range, Hz
    std::vector<FreqRange> sample_rates;         // accepted sample-rate intervals
    std::vector<double> gain_steps_db;           // discrete manual gain values

    bool supports_sample_rate(double rate_sps) const;
    bool supports_gain(double gain_db, double tolerance_db = 0.05) const;
};

// Values the hardware settled on after coercing a configure() request
struct AppliedTuning {
    double center_freq_hz{0.0};   // hardware frequency, offset included
    double sample_rate_sps{0.0};
};

// ============================================================================
// Sample Source Interface
// ============================================================================
// configure() and read_block() are never called concurrently; the caller
// serializes them. read_block() throws TimeoutError when no full block
// arrived in time and DeviceFailureError when the device is gone.
class ISampleSource {
public:
    virtual ~ISampleSource() = default;

    virtual SourceCapabilities capabilities() const = 0;

    // Apply center frequency (hardware, offset already included), rate, gain.
    // Returns the frequency and rate actually in effect; blocks read
    // afterwards are tagged with the same values.
    virtual AppliedTuning configure(double center_freq_hz,
                           double sample_rate_sps,
                           const GainSetting& gain) = 0;

    virtual SampleBlock read_block(size_t num_samples,
                                   std::chrono::milliseconds timeout) = 0;

    virtual std::string get_name() const = 0;
};

#endif // SAMPLE_SOURCE_HPP

// ============================================================================
// tuning_controller.hpp - Owns DeviceConfig and serializes device changes
// ============================================================================
#ifndef TUNING_CONTROLLER_HPP
#define TUNING_CONTROLLER_HPP

#include "sample_source.hpp"
#include "spectrum_types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

// Out-of-range center frequencies are either clamped to the nearest valid
// center (the applied value is returned) or rejected with OutOfRangeError.
enum class RangePolicy {
    Clamp,
    Reject
};

// ============================================================================
// ConfigSnapshot - configuration valid for one acquisition cycle
// ============================================================================
struct ConfigSnapshot {
    DeviceConfig config;
    uint64_t generation{0};
};

// ============================================================================
// TuningController
// ============================================================================
// Setters are serialized by the change lock. A setter that touches the
// hardware also takes the device lock, which the acquisition loop holds for
// the duration of one block read, so a device change lands between two
// blocks and never in the middle of one. FFT size and averaging changes
// commit without waiting for the read; the cycle in flight keeps the
// snapshot it started with. The committed frequency and rate are the values
// the source reports after coercion. On any failure the previous
// configuration is kept.
class TuningController {
public:
    static constexpr size_t kMinFftSize = 16;
    static constexpr size_t kMaxFftSize = 65536;

    static bool is_valid_fft_size(size_t n) {
        return n >= kMinFftSize && n <= kMaxFftSize && (n & (n - 1)) == 0;
    }

    // geometry_changed is true when the FFT size or sample rate changed
    using ChangeListener = std::function<void(const ConfigSnapshot&, bool geometry_changed)>;

    TuningController(ISampleSource& source,
                     const DeviceConfig& initial,
                     RangePolicy policy = RangePolicy::Clamp);

    // Pushes the initial configuration to the source
    void apply_initial();

    // Returns the applied nominal center frequency
    double set_center_frequency(double freq_hz);
    double set_frequency_offset(double offset_hz);
    void set_gain(const GainSetting& gain);
    void set_sample_rate(double rate_sps);
    void set_fft_size(size_t n);
    void set_averaging(AveragingMode mode, double factor);

    void set_range_policy(RangePolicy policy);
    RangePolicy range_policy() const;

    DeviceConfig current_config() const;
    ConfigSnapshot snapshot() const;
    const SourceCapabilities& capabilities() const { return caps_; }

    void add_listener(ChangeListener listener);

    // Read one block with the configuration current at the start of the read
    SampleBlock read_block(ConfigSnapshot& snapshot, std::chrono::milliseconds timeout);

private:
    // Nearest valid nominal center for the given offset/rate, or throws
    double resolve_center(double freq_hz, double offset_hz, double rate_sps,
                          RangePolicy policy) const;
    // Returns the configuration as committed
    DeviceConfig apply_and_commit(DeviceConfig next, bool touch_device);

    ISampleSource& source_;
    SourceCapabilities caps_;

    std::mutex change_mutex_;           // one setter at a time
    mutable std::mutex device_mutex_;   // held for a block read or a device change
    mutable std::mutex config_mutex_;   // guards config_, generation_, policy_
    DeviceConfig config_;
    uint64_t generation_{0};
    RangePolicy policy_;

    std::mutex listener_mutex_;
    std::vector<ChangeListener> listeners_;
};

#endif // TUNING_CONTROLLER_HPP

// ============================================================================
// tuning_controller.cpp - Validated, atomic device configuration changes
// ============================================================================
#include "tuning_controller.hpp"
#include "scan_errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string mhz(double hz) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << hz / 1e6 << " MHz";
    return oss.str();
}

} // namespace

TuningController::TuningController(ISampleSource& source,
                                   const DeviceConfig& initial,
                                   RangePolicy policy)
    : source_(source), caps_(source.capabilities()), config_(initial), policy_(policy) {}

void TuningController::add_listener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

void TuningController::set_range_policy(RangePolicy policy) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    policy_ = policy;
}

RangePolicy TuningController::range_policy() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return policy_;
}

DeviceConfig TuningController::current_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

ConfigSnapshot TuningController::snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return ConfigSnapshot{config_, generation_};
}

// ============================================================================
// Range resolution
// ============================================================================
// Valid hardware centers keep [center - rate/2, center + rate/2] inside the
// tuning range. Returned value is the nominal (offset excluded) center.
double TuningController::resolve_center(double freq_hz, double offset_hz,
                                        double rate_sps, RangePolicy policy) const {
    const double lo = caps_.tuning_range.start + rate_sps / 2.0;
    const double hi = caps_.tuning_range.stop - rate_sps / 2.0;
    if (lo > hi) {
        throw OutOfRangeError("Sample rate " + mhz(rate_sps)
                              + " is wider than the tuning range");
    }

    const double hw = freq_hz + offset_hz;
    if (hw >= lo && hw <= hi) return freq_hz;

    if (policy == RangePolicy::Reject) {
        throw OutOfRangeError("Frequency " + mhz(freq_hz) + " (offset " + mhz(offset_hz)
                              + ") outside tunable range " + mhz(lo - offset_hz)
                              + " - " + mhz(hi - offset_hz));
    }
    return std::max(lo, std::min(hw, hi)) - offset_hz;
}

DeviceConfig TuningController::apply_and_commit(DeviceConfig next, bool touch_device) {
    if (touch_device) {
        const AppliedTuning applied =
            source_.configure(next.hardware_freq_hz(), next.sample_rate_sps, next.gain);
        if (applied.sample_rate_sps > 0.0) {
            next.sample_rate_sps = applied.sample_rate_sps;
        }
        if (applied.center_freq_hz > 0.0 && applied.center_freq_hz != next.hardware_freq_hz()) {
            next.center_freq_hz = applied.center_freq_hz - next.freq_offset_hz;
        }
    }

    ConfigSnapshot snap;
    bool geometry_changed = false;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        geometry_changed = !DeviceConfig::same_geometry(config_, next);
        config_ = next;
        ++generation_;
        snap = ConfigSnapshot{config_, generation_};
    }

    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (auto& listener : listeners_) {
        listener(snap, geometry_changed);
    }
    return next;
}

// ============================================================================
// Setters
// ============================================================================

void TuningController::apply_initial() {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    DeviceConfig next = current_config();

    if (!is_valid_fft_size(next.fft_size)) {
        throw OutOfRangeError("FFT size must be a power of 2 in [16, 65536]: "
                              + std::to_string(next.fft_size));
    }
    if (!caps_.supports_sample_rate(next.sample_rate_sps)) {
        throw OutOfRangeError("Sample rate " + mhz(next.sample_rate_sps) + " not supported");
    }
    if (!next.gain.automatic && !caps_.supports_gain(next.gain.value_db)) {
        throw InvalidGainError("Gain " + next.gain.to_string() + " not supported");
    }
    next.center_freq_hz = resolve_center(next.center_freq_hz, next.freq_offset_hz,
                                         next.sample_rate_sps, range_policy());

    std::cout << "[tuning] " << source_.get_name() << ": center " << mhz(next.center_freq_hz)
              << ", rate " << mhz(next.sample_rate_sps)
              << ", gain " << next.gain.to_string()
              << ", FFT " << next.fft_size << "\n";
    apply_and_commit(next, true);
}

double TuningController::set_center_frequency(double freq_hz) {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    DeviceConfig next = current_config();
    next.center_freq_hz = resolve_center(freq_hz, next.freq_offset_hz,
                                         next.sample_rate_sps, range_policy());
    if (next.center_freq_hz != freq_hz) {
        std::cout << "[tuning] Requested " << mhz(freq_hz) << " clamped to "
                  << mhz(next.center_freq_hz) << "\n";
    }
    return apply_and_commit(next, true).center_freq_hz;
}

double TuningController::set_frequency_offset(double offset_hz) {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    DeviceConfig next = current_config();
    next.freq_offset_hz = offset_hz;
    next.center_freq_hz = resolve_center(next.center_freq_hz, offset_hz,
                                         next.sample_rate_sps, range_policy());
    return apply_and_commit(next, true).center_freq_hz;
}

void TuningController::set_gain(const GainSetting& gain) {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    DeviceConfig next = current_config();
    if (gain.automatic) {
        next.gain = GainSetting::make_auto();
    } else {
        auto it = std::find_if(caps_.gain_steps_db.begin(), caps_.gain_steps_db.end(),
                               [&](double step) { return std::abs(step - gain.value_db) <= 0.05; });
        if (it == caps_.gain_steps_db.end()) {
            throw InvalidGainError("Gain " + gain.to_string() + " is not a supported step");
        }
        next.gain = GainSetting::manual(*it);
    }
    apply_and_commit(next, true);
}

void TuningController::set_sample_rate(double rate_sps) {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    if (!caps_.supports_sample_rate(rate_sps)) {
        throw OutOfRangeError("Sample rate " + mhz(rate_sps) + " not supported");
    }
    DeviceConfig next = current_config();
    next.sample_rate_sps = rate_sps;
    next.center_freq_hz = resolve_center(next.center_freq_hz, next.freq_offset_hz,
                                         rate_sps, range_policy());
    apply_and_commit(next, true);
}

void TuningController::set_fft_size(size_t n) {
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    if (!is_valid_fft_size(n)) {
        throw OutOfRangeError("FFT size must be a power of 2 in [16, 65536]: "
                              + std::to_string(n));
    }
    DeviceConfig next = current_config();
    next.fft_size = n;
    apply_and_commit(next, false);
}

void TuningController::set_averaging(AveragingMode mode, double factor) {
    if (mode == AveragingMode::Exponential && !(factor >= 0.0 && factor < 1.0)) {
        throw OutOfRangeError("Exponential averaging factor must be in [0, 1)");
    }
    if (mode == AveragingMode::Block && !(factor >= 1.0)) {
        throw OutOfRangeError("Block averaging needs at least 1 block");
    }
    std::lock_guard<std::mutex> change_lock(change_mutex_);
    DeviceConfig next = current_config();
    next.averaging = mode;
    next.averaging_factor = factor;
    apply_and_commit(next, false);
}

// ============================================================================
// Block reads
// ============================================================================
SampleBlock TuningController::read_block(ConfigSnapshot& snap,
                                         std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> device_lock(device_mutex_);
    snap = snapshot();
    return source_.read_block(snap.config.fft_size, timeout);
}

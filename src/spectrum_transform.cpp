// ============================================================================
// spectrum_transform.cpp - Windowed FFT power spectrum with averaging
// ============================================================================
#include "spectrum_transform.hpp"
#include "scan_errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

SpectrumTransform::SpectrumTransform(WindowType window,
                                     float floor_db,
                                     float reference_power)
    : window_type_(window), floor_db_(floor_db), reference_power_(reference_power) {
    if (reference_power_ <= 0.0f) {
        throw std::invalid_argument("Reference power must be positive");
    }
}

void SpectrumTransform::set_window(WindowType window) {
    window_type_ = window;
    window_.clear();
    reset();
}

void SpectrumTransform::reset() {
    have_average_ = false;
    average_.clear();
    blocks_accumulated_ = 0;
}

// ============================================================================
// Window tables
// ============================================================================
// Periodic forms (denominator N), the usual choice for spectral analysis.
std::vector<float> SpectrumTransform::make_window(WindowType type, size_t n) {
    std::vector<float> w(n, 1.0f);
    const double two_pi = 2.0 * M_PI;
    for (size_t i = 0; i < n; i++) {
        double x = static_cast<double>(i) / static_cast<double>(n);
        switch (type) {
            case WindowType::Rectangular:
                break;
            case WindowType::Hann:
                w[i] = static_cast<float>(0.5 - 0.5 * std::cos(two_pi * x));
                break;
            case WindowType::Hamming:
                w[i] = static_cast<float>(0.54 - 0.46 * std::cos(two_pi * x));
                break;
            case WindowType::Blackman:
                w[i] = static_cast<float>(0.42 - 0.5 * std::cos(two_pi * x)
                                          + 0.08 * std::cos(2.0 * two_pi * x));
                break;
        }
    }
    return w;
}

void SpectrumTransform::prepare_window(size_t n) {
    if (window_.size() == n) return;
    window_ = make_window(window_type_, n);
    double sum = std::accumulate(window_.begin(), window_.end(), 0.0);
    window_norm_ = 1.0 / (sum * sum);
    work_.assign(n, {0.0f, 0.0f});
    power_.assign(n, 0.0);
}

// ============================================================================
// FFT - radix-2 decimation in time
// ============================================================================
void SpectrumTransform::fft(std::vector<std::complex<float>>& x) {
    const size_t N = x.size();
    if (N <= 1) return;
    if (!is_power_of_2(N)) {
        throw std::invalid_argument("FFT size must be power of 2");
    }

    // Bit-reversal permutation
    size_t j = 0;
    for (size_t i = 0; i < N - 1; i++) {
        if (i < j) std::swap(x[i], x[j]);
        size_t k = N / 2;
        while (k <= j) {
            j -= k;
            k /= 2;
        }
        j += k;
    }

    // Butterflies; twiddles in double to keep large N accurate
    for (size_t m = 2; m <= N; m <<= 1) {
        const size_t m2 = m / 2;
        const double theta = -2.0 * M_PI / static_cast<double>(m);
        for (size_t k = 0; k < m2; k++) {
            std::complex<float> w(static_cast<float>(std::cos(theta * k)),
                                  static_cast<float>(std::sin(theta * k)));
            for (size_t s = k; s < N; s += m) {
                std::complex<float> t = w * x[s + m2];
                std::complex<float> u = x[s];
                x[s] = u + t;
                x[s + m2] = u - t;
            }
        }
    }
}

bool SpectrumTransform::same_averaging_config(const DeviceConfig& config) const {
    return average_config_.center_freq_hz == config.center_freq_hz
        && average_config_.freq_offset_hz == config.freq_offset_hz
        && average_config_.sample_rate_sps == config.sample_rate_sps
        && average_config_.fft_size == config.fft_size
        && average_config_.gain == config.gain
        && average_config_.averaging == config.averaging
        && average_config_.averaging_factor == config.averaging_factor;
}

float SpectrumTransform::to_db(double power) const {
    double ratio = power / reference_power_;
    if (!(ratio > 0.0)) return floor_db_;
    double db = 10.0 * std::log10(ratio);
    return db < floor_db_ ? floor_db_ : static_cast<float>(db);
}

// ============================================================================
// process
// ============================================================================
bool SpectrumTransform::process(const SampleBlock& block,
                                const DeviceConfig& config,
                                SpectrumRow& row) {
    const size_t N = config.fft_size;
    if (block.size() != N) {
        throw ConfigMismatchError("Block of " + std::to_string(block.size())
                                  + " samples does not match FFT size "
                                  + std::to_string(N));
    }
    if (!is_power_of_2(N)) {
        throw OutOfRangeError("FFT size must be power of 2: " + std::to_string(N));
    }

    prepare_window(N);
    for (size_t i = 0; i < N; i++) {
        work_[i] = block.samples[i] * window_[i];
    }
    fft(work_);
    for (size_t i = 0; i < N; i++) {
        power_[i] = std::norm(work_[i]) * window_norm_;
    }

    // Averaging in linear power
    const std::vector<double>* out = &power_;
    if (config.averaging != AveragingMode::None) {
        if (!have_average_ || !same_averaging_config(config)) {
            reset();
            have_average_ = true;
            average_config_ = config;
            average_.assign(N, 0.0);
        }

        if (config.averaging == AveragingMode::Exponential) {
            const double a = std::max(0.0, std::min(config.averaging_factor, 0.999));
            if (blocks_accumulated_ == 0) {
                average_ = power_;
            } else {
                for (size_t i = 0; i < N; i++) {
                    average_[i] = a * average_[i] + (1.0 - a) * power_[i];
                }
            }
            blocks_accumulated_++;
            out = &average_;
        } else {
            const size_t M = std::max<size_t>(1, static_cast<size_t>(std::lround(config.averaging_factor)));
            for (size_t i = 0; i < N; i++) {
                average_[i] += power_[i];
            }
            if (++blocks_accumulated_ < M) {
                return false;
            }
            for (size_t i = 0; i < N; i++) {
                power_[i] = average_[i] / static_cast<double>(M);
            }
            std::fill(average_.begin(), average_.end(), 0.0);
            blocks_accumulated_ = 0;
            out = &power_;
        }
    } else if (have_average_) {
        reset();
    }

    // FFT shift: move zero frequency to the center while converting to dB
    const size_t mid = N / 2;
    row.bins_db.resize(N);
    for (size_t i = 0; i < N; i++) {
        row.bins_db[i] = to_db((*out)[(i + mid) % N]);
    }

    row.center_freq_hz = config.center_freq_hz;
    row.freq_offset_hz = config.freq_offset_hz;
    row.span_hz = config.sample_rate_sps;
    row.captured_at = block.captured_at;
    return true;
}

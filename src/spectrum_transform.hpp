// ============================================================================
// spectrum_transform.hpp - IQ block to DC-centered power spectrum (dB)
// ============================================================================
#ifndef SPECTRUM_TRANSFORM_HPP
#define SPECTRUM_TRANSFORM_HPP

#include "spectrum_types.hpp"
#include <complex>
#include <vector>

// ============================================================================
// SpectrumTransform
// ============================================================================
// Pipeline per block:
//   1. window (Hann by default)
//   2. radix-2 FFT of size N
//   3. |X[k]|^2 normalized by (sum of window)^2, so a unit complex tone
//      reads 0 dB in its bin
//   4. optional averaging in linear power
//   5. FFT shift (DC in bin N/2), 10*log10(p / reference), floor clamp
//
// Only the acquisition thread calls process(); the object keeps the
// averaging state of the configuration it last saw.
class SpectrumTransform {
public:
    explicit SpectrumTransform(WindowType window = WindowType::Hann,
                               float floor_db = -200.0f,
                               float reference_power = 1.0f);

    // Returns false while a block average is still accumulating.
    // Throws ConfigMismatchError if block.size() != config.fft_size.
    bool process(const SampleBlock& block, const DeviceConfig& config, SpectrumRow& row);

    // Drop any averaging state
    void reset();

    void set_window(WindowType window);
    WindowType window() const { return window_type_; }
    float floor_db() const { return floor_db_; }
    float reference_power() const { return reference_power_; }

    // In-place Cooley-Tukey FFT, N must be a power of 2
    static void fft(std::vector<std::complex<float>>& x);
    static bool is_power_of_2(size_t n) { return n != 0 && (n & (n - 1)) == 0; }
    static std::vector<float> make_window(WindowType type, size_t n);

private:
    void prepare_window(size_t n);
    bool same_averaging_config(const DeviceConfig& config) const;
    float to_db(double power) const;

    WindowType window_type_;
    float floor_db_;
    float reference_power_;

    std::vector<float> window_;
    double window_norm_{1.0};            // 1 / (sum of window)^2
    std::vector<std::complex<float>> work_;
    std::vector<double> power_;

    // Averaging state
    bool have_average_{false};
    DeviceConfig average_config_{};
    std::vector<double> average_;
    size_t blocks_accumulated_{0};
};

#endif // SPECTRUM_TRANSFORM_HPP

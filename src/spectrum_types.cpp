// ============================================================================
// spectrum_types.cpp - Row frequency mapping and enum conversions
// ============================================================================
#include "spectrum_types.hpp"
#include "scan_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

double SpectrumRow::bin_frequency(size_t i) const {
    const double n = static_cast<double>(bins_db.size());
    return center_freq_hz + freq_offset_hz - span_hz / 2.0 + i * (span_hz / n);
}

size_t SpectrumRow::bin_for_frequency(double freq_hz) const {
    if (bins_db.empty() || span_hz <= 0.0) return 0;
    const double n = static_cast<double>(bins_db.size());
    const double start = center_freq_hz + freq_offset_hz - span_hz / 2.0;
    double idx = std::round((freq_hz - start) / (span_hz / n));
    idx = std::max(0.0, std::min(idx, n - 1.0));
    return static_cast<size_t>(idx);
}

std::string GainSetting::to_string() const {
    if (automatic) return "AUTO";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value_db << " dB";
    return oss.str();
}

bool GainSetting::operator==(const GainSetting& other) const {
    if (automatic != other.automatic) return false;
    return automatic || value_db == other.value_db;
}

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OutOfRange:     return "OutOfRange";
        case ErrorKind::InvalidGain:    return "InvalidGain";
        case ErrorKind::Timeout:        return "Timeout";
        case ErrorKind::ConfigMismatch: return "ConfigMismatch";
        case ErrorKind::DeviceFailure:  return "DeviceFailure";
        default:                        return "Unknown";
    }
}

std::string averaging_mode_to_string(AveragingMode mode) {
    switch (mode) {
        case AveragingMode::None:        return "none";
        case AveragingMode::Exponential: return "exp";
        case AveragingMode::Block:       return "block";
        default:                         return "unknown";
    }
}

AveragingMode string_to_averaging_mode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "none") return AveragingMode::None;
    if (lower == "exp" || lower == "exponential") return AveragingMode::Exponential;
    if (lower == "block") return AveragingMode::Block;
    throw std::invalid_argument("Unknown averaging mode: " + str);
}

std::string window_type_to_string(WindowType type) {
    switch (type) {
        case WindowType::Rectangular: return "rect";
        case WindowType::Hann:        return "hann";
        case WindowType::Hamming:     return "hamming";
        case WindowType::Blackman:    return "blackman";
        default:                      return "unknown";
    }
}

WindowType string_to_window_type(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "rect" || lower == "rectangular") return WindowType::Rectangular;
    if (lower == "hann") return WindowType::Hann;
    if (lower == "hamming") return WindowType::Hamming;
    if (lower == "blackman") return WindowType::Blackman;
    throw std::invalid_argument("Unknown window type: " + str);
}

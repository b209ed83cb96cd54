// ============================================================================
// sample_source.cpp - Capability checks shared by all sample sources
// ============================================================================
#include "sample_source.hpp"
#include <cmath>

bool SourceCapabilities::supports_sample_rate(double rate_sps) const {
    if (sample_rates.empty()) return rate_sps > 0.0;
    for (const auto& r : sample_rates) {
        if (r.contains(rate_sps)) return true;
    }
    return false;
}

bool SourceCapabilities::supports_gain(double gain_db, double tolerance_db) const {
    for (double step : gain_steps_db) {
        if (std::abs(step - gain_db) <= tolerance_db) return true;
    }
    return false;
}

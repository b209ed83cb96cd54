// ============================================================================
// intensity_scale.hpp - dB range used to map spectrum power onto 0..1
// ============================================================================
#ifndef INTENSITY_SCALE_HPP
#define INTENSITY_SCALE_HPP

#include <mutex>
#include <string>
#include <vector>

// Each bound is either fixed or AUTO. An AUTO bound follows the lowest
// (highest) value seen since the last reset; retuning or changing the gain
// resets it.
class IntensityScale {
public:
    IntensityScale();

    void set_min_auto();
    void set_min(float db);
    void set_max_auto();
    void set_max(float db);

    bool min_is_auto() const;
    bool max_is_auto() const;

    // Forget auto-scaled bounds
    void reset();

    // Widen auto bounds with one row of dB values
    void observe(const std::vector<float>& bins_db);

    // (db - min) / (max - min) clamped to [0, 1]; 0 while the range is unknown
    float normalize(float db) const;

    bool has_range() const;
    float min_db() const;
    float max_db() const;
    float range_db() const;

    // "AUTO" or the bound rounded to whole dB
    std::string min_string() const;
    std::string max_string() const;

private:
    mutable std::mutex mutex_;
    bool min_auto_{true};
    bool max_auto_{true};
    bool have_min_{false};
    bool have_max_{false};
    float min_db_{0.0f};
    float max_db_{0.0f};
};

#endif // INTENSITY_SCALE_HPP

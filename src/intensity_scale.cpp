// ============================================================================
// intensity_scale.cpp - Auto / fixed intensity bounds
// ============================================================================
#include "intensity_scale.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

IntensityScale::IntensityScale() = default;

void IntensityScale::set_min_auto() {
    std::lock_guard<std::mutex> lock(mutex_);
    min_auto_ = true;
    have_min_ = false;
    if (max_auto_) have_max_ = false;
}

void IntensityScale::set_min(float db) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_auto_ = false;
    have_min_ = true;
    min_db_ = db;
    if (max_auto_) have_max_ = false;
}

void IntensityScale::set_max_auto() {
    std::lock_guard<std::mutex> lock(mutex_);
    max_auto_ = true;
    have_max_ = false;
    if (min_auto_) have_min_ = false;
}

void IntensityScale::set_max(float db) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_auto_ = false;
    have_max_ = true;
    max_db_ = db;
    if (min_auto_) have_min_ = false;
}

bool IntensityScale::min_is_auto() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_auto_;
}

bool IntensityScale::max_is_auto() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_auto_;
}

void IntensityScale::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (min_auto_) have_min_ = false;
    if (max_auto_) have_max_ = false;
}

void IntensityScale::observe(const std::vector<float>& bins_db) {
    if (bins_db.empty()) return;
    auto mm = std::minmax_element(bins_db.begin(), bins_db.end());

    std::lock_guard<std::mutex> lock(mutex_);
    if (min_auto_) {
        min_db_ = have_min_ ? std::min(min_db_, *mm.first) : *mm.first;
        have_min_ = true;
    }
    if (max_auto_) {
        max_db_ = have_max_ ? std::max(max_db_, *mm.second) : *mm.second;
        have_max_ = true;
    }
}

float IntensityScale::normalize(float db) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_min_ || !have_max_ || max_db_ <= min_db_) return 0.0f;
    float v = (db - min_db_) / (max_db_ - min_db_);
    return std::max(0.0f, std::min(v, 1.0f));
}

bool IntensityScale::has_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return have_min_ && have_max_;
}

float IntensityScale::min_db() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_db_;
}

float IntensityScale::max_db() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_db_;
}

float IntensityScale::range_db() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (have_min_ && have_max_) ? max_db_ - min_db_ : 0.0f;
}

std::string IntensityScale::min_string() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (min_auto_) return "AUTO";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << min_db_;
    return oss.str();
}

std::string IntensityScale::max_string() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_auto_) return "AUTO";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << max_db_;
    return oss.str();
}

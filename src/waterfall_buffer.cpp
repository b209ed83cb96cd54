// ============================================================================
// waterfall_buffer.cpp - Spectrum history ring with peak hold
// ============================================================================
#include "waterfall_buffer.hpp"
#include <algorithm>
#include <stdexcept>

WaterfallBuffer::WaterfallBuffer(size_t capacity, RowGeometry geometry)
    : capacity_(capacity), geometry_(geometry) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Waterfall capacity must be at least 1 row");
    }
}

IngestResult WaterfallBuffer::ingest(const SpectrumRow& row) {
    return ingest(std::make_shared<const SpectrumRow>(row));
}

IngestResult WaterfallBuffer::ingest(RowPtr row) {
    if (!row) {
        throw std::invalid_argument("Cannot ingest a null row");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // An unset geometry adopts the first row's
    if (geometry_.bins == 0) {
        geometry_ = RowGeometry{row->size(), row->span_hz};
    }
    if (!geometry_.matches(*row)) {
        return IngestResult::GeometryMismatch;
    }

    update_peak(*row);

    if (offered_++ % decimation_ != 0) {
        return IngestResult::Decimated;
    }

    rows_.push_back(std::move(row));
    while (rows_.size() > capacity_) {
        rows_.pop_front();
    }
    ++stored_;
    return IngestResult::Stored;
}

void WaterfallBuffer::update_peak(const SpectrumRow& row) {
    if (peak_mode_ == PeakHoldMode::Off) return;
    if (peak_.size() != row.size()) {
        peak_ = row.bins_db;
        return;
    }
    const float decay = (peak_mode_ == PeakHoldMode::Decay) ? decay_db_per_row_ : 0.0f;
    for (size_t i = 0; i < peak_.size(); i++) {
        peak_[i] = std::max(row.bins_db[i], peak_[i] - decay);
    }
}

std::vector<WaterfallBuffer::RowPtr> WaterfallBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<RowPtr>(rows_.begin(), rows_.end());
}

WaterfallBuffer::RowPtr WaterfallBuffer::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.empty() ? RowPtr() : rows_.back();
}

void WaterfallBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.clear();
    peak_.clear();
    offered_ = 0;
}

void WaterfallBuffer::reset(const RowGeometry& geometry) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.clear();
    peak_.clear();
    offered_ = 0;
    geometry_ = geometry;
}

RowGeometry WaterfallBuffer::geometry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return geometry_;
}

size_t WaterfallBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

size_t WaterfallBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void WaterfallBuffer::set_capacity(size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("Waterfall capacity must be at least 1 row");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
    while (rows_.size() > capacity_) {
        rows_.pop_front();
    }
}

void WaterfallBuffer::set_decimation(size_t n) {
    if (n == 0) {
        throw std::invalid_argument("Row decimation must be at least 1");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    decimation_ = n;
    offered_ = 0;
}

size_t WaterfallBuffer::decimation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decimation_;
}

void WaterfallBuffer::set_peak_hold(PeakHoldMode mode, float decay_db_per_row) {
    if (decay_db_per_row < 0.0f) {
        throw std::invalid_argument("Peak decay must not be negative");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    peak_mode_ = mode;
    decay_db_per_row_ = decay_db_per_row;
    peak_.clear();
}

PeakHoldMode WaterfallBuffer::peak_hold_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_mode_;
}

std::vector<float> WaterfallBuffer::peak_hold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void WaterfallBuffer::reset_peak_hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    peak_.clear();
}

uint64_t WaterfallBuffer::total_stored() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
}

IntensitySurface WaterfallBuffer::intensity_surface(const IntensityScale& scale) const {
    std::vector<RowPtr> rows = snapshot();

    IntensitySurface surface;
    surface.rows = rows.size();
    surface.cols = rows.empty() ? 0 : rows.front()->size();
    surface.values.reserve(surface.rows * surface.cols);
    for (const auto& row : rows) {
        for (float db : row->bins_db) {
            surface.values.push_back(scale.normalize(db));
        }
    }
    return surface;
}

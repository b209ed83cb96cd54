// ============================================================================
// waterfall_buffer.hpp - Bounded FIFO history of spectrum rows
// ============================================================================
#ifndef WATERFALL_BUFFER_HPP
#define WATERFALL_BUFFER_HPP

#include "intensity_scale.hpp"
#include "spectrum_types.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

// Width and span every row in the buffer shares
struct RowGeometry {
    size_t bins{0};
    double span_hz{0.0};

    bool matches(const SpectrumRow& row) const {
        return row.size() == bins && row.span_hz == span_hz;
    }
};

enum class PeakHoldMode {
    Off,
    Decay,   // peak drops decay_db_per_row per offered row, never below the row
    Hold     // peak only resets on clear() / reset_peak_hold()
};

enum class IngestResult {
    Stored,
    Decimated,          // skipped by row decimation, peak hold still updated
    GeometryMismatch    // row built under a different FFT size or sample rate
};

// Row-major intensity matrix, oldest row first, values in [0, 1]
struct IntensitySurface {
    size_t rows{0};
    size_t cols{0};
    std::vector<float> values;

    float at(size_t r, size_t c) const { return values[r * cols + c]; }
};

// ============================================================================
// WaterfallBuffer
// ============================================================================
// Rows are immutable once stored and shared with readers, so snapshot()
// only copies pointers under the lock.
class WaterfallBuffer {
public:
    using RowPtr = std::shared_ptr<const SpectrumRow>;

    explicit WaterfallBuffer(size_t capacity, RowGeometry geometry = RowGeometry{});

    IngestResult ingest(const SpectrumRow& row);
    IngestResult ingest(RowPtr row);

    // Oldest first
    std::vector<RowPtr> snapshot() const;
    RowPtr latest() const;

    void clear();
    // Clear and accept rows of a new geometry from now on
    void reset(const RowGeometry& geometry);
    RowGeometry geometry() const;

    size_t size() const;
    size_t capacity() const;
    void set_capacity(size_t capacity);

    // Store only every n-th offered row (n >= 1)
    void set_decimation(size_t n);
    size_t decimation() const;

    void set_peak_hold(PeakHoldMode mode, float decay_db_per_row = 0.5f);
    PeakHoldMode peak_hold_mode() const;
    std::vector<float> peak_hold() const;
    void reset_peak_hold();

    uint64_t total_stored() const;

    IntensitySurface intensity_surface(const IntensityScale& scale) const;

private:
    void update_peak(const SpectrumRow& row);

    mutable std::mutex mutex_;
    std::deque<RowPtr> rows_;
    size_t capacity_;
    RowGeometry geometry_;

    size_t decimation_{1};
    uint64_t offered_{0};
    uint64_t stored_{0};

    PeakHoldMode peak_mode_{PeakHoldMode::Off};
    float decay_db_per_row_{0.5f};
    std::vector<float> peak_;
};

#endif // WATERFALL_BUFFER_HPP

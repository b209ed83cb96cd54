// ============================================================================
// row_queue.hpp - Thread-safe FIFO handing spectrum rows to a consumer
// ============================================================================
#ifndef ROW_QUEUE_HPP
#define ROW_QUEUE_HPP

#include "spectrum_types.hpp"
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>

// Bounded: when full, the oldest row is dropped so the producer never waits.
class RowQueue {
public:
    using RowPtr = std::shared_ptr<const SpectrumRow>;

    explicit RowQueue(size_t max_rows = 64);

    void push(RowPtr row);

    // Wait up to timeout_s for a row. Returns false on timeout or when
    // stopped with nothing left to deliver.
    bool pop(RowPtr& row, double timeout_s = 0.2);

    void notify_stop();
    void restart();

    size_t size() const;
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<RowPtr> queue_;
    size_t max_rows_;
    uint64_t dropped_{0};
    bool stopped_{false};
};

#endif // ROW_QUEUE_HPP

// ============================================================================
// row_queue.cpp - RowQueue implementation
// ============================================================================
#include "row_queue.hpp"
#include <chrono>
#include <stdexcept>

RowQueue::RowQueue(size_t max_rows) : max_rows_(max_rows) {
    if (max_rows_ == 0) {
        throw std::invalid_argument("Row queue needs room for at least one row");
    }
}

void RowQueue::push(RowPtr row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= max_rows_) {
        queue_.pop();
        ++dropped_;
    }
    queue_.push(std::move(row));
    cv_.notify_one();
}

bool RowQueue::pop(RowPtr& row, double timeout_s) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, std::chrono::duration<double>(timeout_s),
                      [this] { return !queue_.empty() || stopped_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    row = std::move(queue_.front());
    queue_.pop();
    return true;
}

void RowQueue::notify_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

void RowQueue::restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
}

size_t RowQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t RowQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

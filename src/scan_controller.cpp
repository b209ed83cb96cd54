// ============================================================================
// scan_controller.cpp - Dwell timer and step advance for frequency sweeps
// ============================================================================
#include "scan_controller.hpp"
#include "scan_errors.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

std::string scan_state_to_string(ScanState state) {
    switch (state) {
        case ScanState::Idle:     return "Idle";
        case ScanState::Scanning: return "Scanning";
        case ScanState::Paused:   return "Paused";
        default:                  return "Unknown";
    }
}

ScanPlan ScanPlan::from_range(double start_hz, double stop_hz, double step_hz,
                              std::chrono::milliseconds dwell,
                              ScanEndPolicy policy) {
    if (step_hz <= 0.0) {
        throw std::invalid_argument("Scan step must be positive");
    }
    if (stop_hz < start_hz) {
        throw std::invalid_argument("Scan stop frequency is below start frequency");
    }
    ScanPlan plan;
    plan.end_policy = policy;
    // Half-step tolerance so an exact stop frequency is included
    const size_t count = static_cast<size_t>(std::floor((stop_hz - start_hz) / step_hz + 0.5)) + 1;
    for (size_t i = 0; i < count; i++) {
        plan.steps.push_back(ScanStep{start_hz + i * step_hz, dwell});
    }
    return plan;
}

ScanController::ScanController(TuneFunction tune, FailureFunction on_failure)
    : tune_(std::move(tune)), on_failure_(std::move(on_failure)) {
    if (!tune_) {
        throw std::invalid_argument("Scan controller needs a tune function");
    }
    worker_ = std::thread(&ScanController::worker_loop, this);
}

ScanController::~ScanController() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

// ============================================================================
// Commands
// ============================================================================

void ScanController::start(const ScanPlan& plan) {
    if (plan.empty()) {
        throw std::invalid_argument("Scan plan has no steps");
    }
    for (const auto& step : plan.steps) {
        if (step.dwell.count() <= 0) {
            throw std::invalid_argument("Scan dwell must be positive");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++epoch_;
    state_ = ScanState::Idle;
    plan_ = plan;
    step_ = 0;
    {
        // Nothing is tagged with a step until the first tune succeeds
        std::lock_guard<std::mutex> tag_lock(tag_mutex_);
        active_step_ = -1;
        active_freq_hz_ = 0.0;
        sweep_rows_.assign(plan_.size(), RowPtr());
    }

    double applied = tune_(plan_.steps[0].freq_hz);
    set_active_locked(0, applied);
    state_ = ScanState::Scanning;
    deadline_ = Clock::now() + plan_.steps[0].dwell;

    std::cout << "[scan] start: " << plan_.size() << " steps from "
              << std::fixed << std::setprecision(3)
              << plan_.steps.front().freq_hz / 1e6 << " to "
              << plan_.steps.back().freq_hz / 1e6 << " MHz, "
              << (plan_.end_policy == ScanEndPolicy::Wrap ? "wrap" : "single pass") << "\n";
    cv_.notify_all();
}

void ScanController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ScanState::Idle) return;
    ++epoch_;
    state_ = ScanState::Idle;
    set_active_locked(-1, 0.0);
    std::cout << "[scan] stopped\n";
    cv_.notify_all();
}

void ScanController::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ScanState::Scanning) return;
    ++epoch_;
    state_ = ScanState::Paused;
    cv_.notify_all();
}

void ScanController::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ScanState::Paused) return;
    ++epoch_;
    state_ = ScanState::Scanning;
    deadline_ = Clock::now() + plan_.steps[step_].dwell;
    cv_.notify_all();
}

ScanState ScanController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ScanPlan ScanController::plan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plan_;
}

int ScanController::current_step() const {
    std::lock_guard<std::mutex> lock(tag_mutex_);
    return active_step_;
}

int ScanController::step_for_center(double center_freq_hz) const {
    std::lock_guard<std::mutex> lock(tag_mutex_);
    if (active_step_ < 0 || active_freq_hz_ != center_freq_hz) return -1;
    return active_step_;
}

void ScanController::record_row(const RowPtr& row) {
    if (!row || row->scan_step < 0) return;
    std::lock_guard<std::mutex> lock(tag_mutex_);
    const size_t step = static_cast<size_t>(row->scan_step);
    if (step < sweep_rows_.size()) {
        sweep_rows_[step] = row;
    }
}

std::vector<ScanController::RowPtr> ScanController::sweep_rows() const {
    std::lock_guard<std::mutex> lock(tag_mutex_);
    return sweep_rows_;
}

void ScanController::set_active_locked(int step, double applied_hz) {
    std::lock_guard<std::mutex> tag_lock(tag_mutex_);
    active_step_ = step;
    active_freq_hz_ = applied_hz;
}

// ============================================================================
// Worker
// ============================================================================

void ScanController::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        if (state_ != ScanState::Scanning) {
            cv_.wait(lock, [this] { return shutdown_ || state_ == ScanState::Scanning; });
            continue;
        }

        const uint64_t epoch = epoch_;
        const Clock::time_point deadline = deadline_;
        bool interrupted = cv_.wait_until(lock, deadline, [this, epoch] {
            return shutdown_ || epoch_ != epoch;
        });
        if (interrupted) continue;

        advance_locked();
        if (failure_pending_) {
            failure_pending_ = false;
            if (on_failure_) {
                const DeviceFailureError error(failure_what_);
                lock.unlock();
                on_failure_(error);
                lock.lock();
            }
        }
    }
}

void ScanController::advance_locked() {
    size_t next = step_ + 1;
    if (next >= plan_.size()) {
        if (plan_.end_policy == ScanEndPolicy::Stop) {
            ++epoch_;
            state_ = ScanState::Idle;
            set_active_locked(-1, 0.0);
            std::cout << "[scan] plan complete\n";
            return;
        }
        next = 0;
    }

    try {
        double applied = tune_(plan_.steps[next].freq_hz);
        step_ = next;
        set_active_locked(static_cast<int>(next), applied);
        ++steps_advanced_;
        deadline_ = Clock::now() + plan_.steps[next].dwell;
    } catch (const DeviceFailureError& e) {
        std::cerr << "[scan] device failure at step " << next << ": " << e.what()
                  << "; sweep stopped\n";
        ++epoch_;
        state_ = ScanState::Idle;
        set_active_locked(-1, 0.0);
        failure_pending_ = true;
        failure_what_ = e.what();
    } catch (const ScanError& e) {
        std::cerr << "[scan] tune to step " << next << " failed ("
                  << error_kind_to_string(e.kind()) << "): " << e.what()
                  << "; sweep stopped\n";
        ++epoch_;
        state_ = ScanState::Idle;
        set_active_locked(-1, 0.0);
    }
}

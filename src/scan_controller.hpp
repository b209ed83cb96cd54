// ============================================================================
// scan_controller.hpp - Frequency sweep across a plan of dwell steps
// ============================================================================
#ifndef SCAN_CONTROLLER_HPP
#define SCAN_CONTROLLER_HPP

#include "scan_errors.hpp"
#include "spectrum_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class ScanState {
    Idle,
    Scanning,
    Paused
};

enum class ScanEndPolicy {
    Wrap,   // go back to the first step
    Stop    // return to Idle after the last dwell
};

std::string scan_state_to_string(ScanState state);

struct ScanStep {
    double freq_hz{0.0};
    std::chrono::milliseconds dwell{100};
};

// ============================================================================
// ScanPlan
// ============================================================================
struct ScanPlan {
    std::vector<ScanStep> steps;
    ScanEndPolicy end_policy{ScanEndPolicy::Wrap};

    bool empty() const { return steps.empty(); }
    size_t size() const { return steps.size(); }

    // Steps start, start+step, ... up to and including stop
    static ScanPlan from_range(double start_hz, double stop_hz, double step_hz,
                               std::chrono::milliseconds dwell,
                               ScanEndPolicy policy = ScanEndPolicy::Wrap);
};

// ============================================================================
// ScanController
// ============================================================================
// A worker thread sleeps on a condition variable until the dwell deadline of
// the current step. stop() and pause() wake it and invalidate the deadline,
// so once they return the pending dwell can no longer fire. The tune call
// runs under the controller lock: stop() waits for an in-flight tune to
// finish, which lets a manual tune issued after stop() always win.
// A DeviceFailureError from a sweep retune ends the sweep and is handed to
// the failure function on the worker thread, outside the controller lock.
class ScanController {
public:
    using RowPtr = std::shared_ptr<const SpectrumRow>;
    // Applies a step frequency and returns the applied nominal center
    using TuneFunction = std::function<double(double freq_hz)>;
    using FailureFunction = std::function<void(const DeviceFailureError&)>;

    explicit ScanController(TuneFunction tune, FailureFunction on_failure = FailureFunction());
    ~ScanController();

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    // Tunes to the first step right away; throws if the plan is unusable or
    // the first tune fails
    void start(const ScanPlan& plan);
    void stop();
    void pause();
    void resume();

    ScanState state() const;
    ScanPlan plan() const;
    int current_step() const;          // -1 when idle
    uint64_t steps_advanced() const { return steps_advanced_.load(); }

    // Step that produced data tuned to center_freq_hz, or -1
    int step_for_center(double center_freq_hz) const;

    // Keep the latest row of each step (sweep panorama)
    void record_row(const RowPtr& row);
    std::vector<RowPtr> sweep_rows() const;

private:
    void worker_loop();
    void advance_locked();
    void set_active_locked(int step, double applied_hz);

    TuneFunction tune_;
    FailureFunction on_failure_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_{false};
    ScanState state_{ScanState::Idle};
    ScanPlan plan_;
    size_t step_{0};
    Clock::time_point deadline_{};
    uint64_t epoch_{0};
    std::atomic<uint64_t> steps_advanced_{0};
    bool failure_pending_{false};
    std::string failure_what_;

    // Read by the acquisition thread to tag rows
    mutable std::mutex tag_mutex_;
    int active_step_{-1};
    double active_freq_hz_{0.0};
    std::vector<RowPtr> sweep_rows_;

    std::thread worker_;
};

#endif // SCAN_CONTROLLER_HPP

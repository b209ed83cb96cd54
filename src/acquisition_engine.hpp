// ============================================================================
// acquisition_engine.hpp - Acquisition loop and command/query interface
// ============================================================================
#ifndef ACQUISITION_ENGINE_HPP
#define ACQUISITION_ENGINE_HPP

#include "intensity_scale.hpp"
#include "row_queue.hpp"
#include "sample_source.hpp"
#include "scan_controller.hpp"
#include "scan_errors.hpp"
#include "spectrum_transform.hpp"
#include "tuning_controller.hpp"
#include "waterfall_buffer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// EngineOptions - startup configuration of the core
// ============================================================================
struct EngineOptions {
    DeviceConfig initial{};
    RangePolicy range_policy{RangePolicy::Clamp};

    WindowType window{WindowType::Hann};
    float floor_db{-200.0f};
    float reference_power{1.0f};

    size_t history_rows{256};
    size_t row_decimation{1};
    PeakHoldMode peak_hold{PeakHoldMode::Off};
    float peak_decay_db{0.5f};

    std::chrono::milliseconds read_timeout{200};
    size_t queue_rows{64};
    bool verbose{false};
};

// Outcome of one acquisition cycle
enum class CycleResult {
    RowStored,
    RowDecimated,     // produced but skipped by waterfall decimation
    Accumulating,     // block average not complete yet
    Timeout,          // read deadline missed, cycle skipped
    ConfigMismatch,   // block length != FFT size, block dropped
    StaleGeometry     // row from before an FFT size / sample rate change
};

std::string cycle_result_to_string(CycleResult result);

struct EngineStats {
    uint64_t cycles{0};
    uint64_t rows{0};
    uint64_t timeouts{0};
    uint64_t mismatches{0};
    uint64_t stale_rows{0};
};

// ============================================================================
// AcquisitionEngine
// ============================================================================
// Owns the sample source and every stage of the pipeline. One acquisition
// thread (start()/stop()) or the caller (run_cycle()) drives the pipeline;
// all commands and queries may be issued from any other thread.
//
// The failure handler runs once per failure, with no engine lock held: on
// the caller of run_cycle(), on the acquisition thread after its loop has
// ended, or on the sweep worker. It may call stop() and start() to reconnect.
class AcquisitionEngine {
public:
    using RowPtr = std::shared_ptr<const SpectrumRow>;
    using RowListener = std::function<void(const RowPtr&)>;
    using FailureHandler = std::function<void(const DeviceFailureError&)>;

    // Validates and applies options.initial to the source; throws on failure
    explicit AcquisitionEngine(std::unique_ptr<ISampleSource> source,
                               const EngineOptions& options = EngineOptions{});
    ~AcquisitionEngine();

    AcquisitionEngine(const AcquisitionEngine&) = delete;
    AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;

    // ===== Loop control =====
    void start();
    void stop();
    bool running() const { return running_.load(); }
    bool failed() const { return failed_.load(); }
    std::string last_error() const;

    // One read -> transform -> ingest cycle on the calling thread.
    // Recoverable errors are absorbed and reported in the result; any other
    // error halts the engine and is rethrown as DeviceFailureError after the
    // failure handler ran.
    CycleResult run_cycle();

    // ===== Queries =====
    DeviceConfig current_config() const { return tuning_.current_config(); }
    std::vector<RowPtr> waterfall_snapshot() const { return waterfall_.snapshot(); }
    std::vector<float> peak_hold() const { return waterfall_.peak_hold(); }
    std::vector<RowPtr> sweep_rows() const { return scan_.sweep_rows(); }
    ScanState scan_state() const { return scan_.state(); }
    int scan_step() const { return scan_.current_step(); }
    EngineStats stats() const;
    IntensitySurface intensity_surface() const;
    double bin_frequency(size_t bin) const;
    const SourceCapabilities& capabilities() const { return tuning_.capabilities(); }

    // ===== Commands =====
    // Manual tuning cancels a running sweep before the new frequency is applied
    double set_center_frequency(double freq_hz);
    double set_frequency_offset(double offset_hz);
    void set_gain(const GainSetting& gain);
    void set_sample_rate(double rate_sps);
    void set_fft_size(size_t n);
    void set_averaging(AveragingMode mode, double factor);
    void set_range_policy(RangePolicy policy) { tuning_.set_range_policy(policy); }

    void start_scan(const ScanPlan& plan);
    void stop_scan();
    void pause_scan();
    void resume_scan();

    void clear_waterfall();
    void set_min_intensity(float db) { intensity_.set_min(db); }
    void set_min_intensity_auto() { intensity_.set_min_auto(); }
    void set_max_intensity(float db) { intensity_.set_max(db); }
    void set_max_intensity_auto() { intensity_.set_max_auto(); }

    // ===== Notification =====
    void add_row_listener(RowListener listener);
    void set_failure_handler(FailureHandler handler);
    RowQueue& row_queue() { return queue_; }

    WaterfallBuffer& waterfall() { return waterfall_; }
    const IntensityScale& intensity_scale() const { return intensity_; }

private:
    void on_config_change(const ConfigSnapshot& snap, bool geometry_changed);
    CycleResult cycle_locked();
    CycleResult drop_block(const ScanError& error);
    void mark_failed(const DeviceFailureError& error);
    void notify_failure();
    void publish(const RowPtr& row);
    void acquisition_loop();

    std::unique_ptr<ISampleSource> source_;
    EngineOptions options_;

    TuningController tuning_;
    SpectrumTransform transform_;
    WaterfallBuffer waterfall_;
    IntensityScale intensity_;
    RowQueue queue_;

    std::mutex cycle_mutex_;   // one cycle at a time (loop thread or run_cycle)
    uint64_t sequence_{0};

    mutable std::mutex stats_mutex_;
    EngineStats stats_;

    mutable std::mutex callback_mutex_;
    std::vector<RowListener> listeners_;
    FailureHandler failure_handler_;
    std::string last_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> notify_pending_{false};

    std::mutex thread_mutex_;   // guards thread_ and retired_
    std::thread thread_;
    std::thread retired_;       // loop thread replaced by a start() from its own handler

    // Declared last: its worker calls into tuning_ and must stop first
    ScanController scan_;
};

#endif // ACQUISITION_ENGINE_HPP

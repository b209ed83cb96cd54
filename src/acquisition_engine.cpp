// ============================================================================
// acquisition_engine.cpp - Read / transform / ingest pipeline
// ============================================================================
#include "acquisition_engine.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

std::string cycle_result_to_string(CycleResult result) {
    switch (result) {
        case CycleResult::RowStored:      return "RowStored";
        case CycleResult::RowDecimated:   return "RowDecimated";
        case CycleResult::Accumulating:   return "Accumulating";
        case CycleResult::Timeout:        return "Timeout";
        case CycleResult::ConfigMismatch: return "ConfigMismatch";
        case CycleResult::StaleGeometry:  return "StaleGeometry";
        default:                          return "Unknown";
    }
}

namespace {

ISampleSource& require_source(const std::unique_ptr<ISampleSource>& source) {
    if (!source) {
        throw std::invalid_argument("Acquisition engine needs a sample source");
    }
    return *source;
}

} // namespace

// ============================================================================
// Construction / destruction
// ============================================================================

AcquisitionEngine::AcquisitionEngine(std::unique_ptr<ISampleSource> source,
                                     const EngineOptions& options)
    : source_(std::move(source)),
      options_(options),
      tuning_(require_source(source_), options.initial, options.range_policy),
      transform_(options.window, options.floor_db, options.reference_power),
      waterfall_(options.history_rows),
      queue_(options.queue_rows),
      scan_([this](double freq_hz) { return tuning_.set_center_frequency(freq_hz); },
            [this](const DeviceFailureError& error) {
                mark_failed(error);
                notify_failure();
            }) {
    waterfall_.set_decimation(options_.row_decimation);
    waterfall_.set_peak_hold(options_.peak_hold, options_.peak_decay_db);

    tuning_.add_listener([this](const ConfigSnapshot& snap, bool geometry_changed) {
        on_config_change(snap, geometry_changed);
    });
    tuning_.apply_initial();

    const DeviceConfig config = tuning_.current_config();
    waterfall_.reset(RowGeometry{config.fft_size, config.sample_rate_sps});
}

AcquisitionEngine::~AcquisitionEngine() {
    stop();
    scan_.stop();
}

// Runs under the tuning change lock; a device change also holds the device
// lock, so no block of the old configuration is being read
void AcquisitionEngine::on_config_change(const ConfigSnapshot& snap, bool geometry_changed) {
    if (geometry_changed) {
        waterfall_.reset(RowGeometry{snap.config.fft_size, snap.config.sample_rate_sps});
        std::cout << "[engine] waterfall cleared: " << snap.config.fft_size << " bins over "
                  << std::fixed << std::setprecision(3)
                  << snap.config.sample_rate_sps / 1e6 << " MHz\n";
    }
    intensity_.reset();
}

// ============================================================================
// Commands
// ============================================================================

double AcquisitionEngine::set_center_frequency(double freq_hz) {
    if (scan_.state() != ScanState::Idle) {
        std::cout << "[engine] manual tune cancels sweep\n";
    }
    scan_.stop();
    return tuning_.set_center_frequency(freq_hz);
}

double AcquisitionEngine::set_frequency_offset(double offset_hz) {
    return tuning_.set_frequency_offset(offset_hz);
}

void AcquisitionEngine::set_gain(const GainSetting& gain) {
    tuning_.set_gain(gain);
}

void AcquisitionEngine::set_sample_rate(double rate_sps) {
    tuning_.set_sample_rate(rate_sps);
}

void AcquisitionEngine::set_fft_size(size_t n) {
    tuning_.set_fft_size(n);
}

void AcquisitionEngine::set_averaging(AveragingMode mode, double factor) {
    tuning_.set_averaging(mode, factor);
}

void AcquisitionEngine::start_scan(const ScanPlan& plan) {
    scan_.start(plan);
}

void AcquisitionEngine::stop_scan() {
    scan_.stop();
}

void AcquisitionEngine::pause_scan() {
    scan_.pause();
}

void AcquisitionEngine::resume_scan() {
    scan_.resume();
}

void AcquisitionEngine::clear_waterfall() {
    waterfall_.clear();
    intensity_.reset();
}

void AcquisitionEngine::add_row_listener(RowListener listener) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    listeners_.push_back(std::move(listener));
}

void AcquisitionEngine::set_failure_handler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    failure_handler_ = std::move(handler);
}

// ============================================================================
// Queries
// ============================================================================

EngineStats AcquisitionEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::string AcquisitionEngine::last_error() const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    return last_error_;
}

IntensitySurface AcquisitionEngine::intensity_surface() const {
    return waterfall_.intensity_surface(intensity_);
}

double AcquisitionEngine::bin_frequency(size_t bin) const {
    const DeviceConfig c = tuning_.current_config();
    const double n = static_cast<double>(c.fft_size);
    return c.hardware_freq_hz() - c.sample_rate_sps / 2.0 + bin * (c.sample_rate_sps / n);
}

// ============================================================================
// Acquisition cycle
// ============================================================================

void AcquisitionEngine::mark_failed(const DeviceFailureError& error) {
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (failed_) return;
        last_error_ = error.what();
        failed_ = true;
        notify_pending_ = true;
    }
    stop_requested_ = true;
    std::cerr << "[engine] device failure: " << error.what() << "\n";
    scan_.stop();
}

// Called with no engine lock held; the handler may stop() and start() again
void AcquisitionEngine::notify_failure() {
    if (!notify_pending_.exchange(false)) return;

    FailureHandler handler;
    std::string what;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        handler = failure_handler_;
        what = last_error_;
    }
    if (handler) handler(DeviceFailureError(what));
}

void AcquisitionEngine::publish(const RowPtr& row) {
    intensity_.observe(row->bins_db);
    scan_.record_row(row);
    queue_.push(row);

    std::vector<RowListener> listeners;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        listeners = listeners_;
    }
    for (auto& listener : listeners) {
        listener(row);
    }
}

CycleResult AcquisitionEngine::run_cycle() {
    try {
        return cycle_locked();
    } catch (const DeviceFailureError&) {
        notify_failure();
        throw;
    }
}

CycleResult AcquisitionEngine::drop_block(const ScanError& error) {
    const bool timeout = error.kind() == ErrorKind::Timeout;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (timeout) {
            ++stats_.timeouts;
        } else {
            ++stats_.mismatches;
        }
    }
    if (!timeout || options_.verbose) {
        std::cerr << "[engine] block dropped: " << error.what() << "\n";
    }
    return timeout ? CycleResult::Timeout : CycleResult::ConfigMismatch;
}

CycleResult AcquisitionEngine::cycle_locked() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    if (failed_) {
        throw DeviceFailureError("Acquisition halted after device failure: " + last_error());
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.cycles;
    }

    ConfigSnapshot snap;
    SampleBlock block;
    try {
        block = tuning_.read_block(snap, options_.read_timeout);
    } catch (const DeviceFailureError& e) {
        mark_failed(e);
        throw;
    } catch (const ScanError& e) {
        if (e.recoverable()) {
            return drop_block(e);
        }
        DeviceFailureError wrapped("Sample source error (" + error_kind_to_string(e.kind())
                                   + "): " + e.what());
        mark_failed(wrapped);
        throw wrapped;
    } catch (const std::exception& e) {
        DeviceFailureError wrapped(std::string("Sample source error: ") + e.what());
        mark_failed(wrapped);
        throw wrapped;
    }

    SpectrumRow row;
    try {
        if (!transform_.process(block, snap.config, row)) {
            return CycleResult::Accumulating;
        }
    } catch (const ConfigMismatchError& e) {
        return drop_block(e);
    }

    row.sequence = ++sequence_;
    row.scan_step = scan_.step_for_center(snap.config.center_freq_hz);
    RowPtr shared = std::make_shared<const SpectrumRow>(std::move(row));

    const IngestResult ingested = waterfall_.ingest(shared);
    if (ingested == IngestResult::GeometryMismatch) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.stale_rows;
        return CycleResult::StaleGeometry;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.rows;
    }
    publish(shared);

    if (options_.verbose) {
        std::cout << "[engine] row " << shared->sequence << " @ "
                  << std::fixed << std::setprecision(3) << shared->center_freq_hz / 1e6
                  << " MHz (gen " << snap.generation << ")\n";
    }
    return ingested == IngestResult::Stored ? CycleResult::RowStored
                                            : CycleResult::RowDecimated;
}

// ============================================================================
// Loop thread
// ============================================================================

void AcquisitionEngine::start() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (running_) return;
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                // Restart from the failure handler: this thread ends right after
                if (retired_.joinable()) finished = std::move(retired_);
                retired_ = std::move(thread_);
            } else {
                finished = std::move(thread_);
            }
        }

        failed_ = false;
        stop_requested_ = false;
        queue_.restart();
        running_ = true;
        thread_ = std::thread(&AcquisitionEngine::acquisition_loop, this);
    }
    if (finished.joinable()) finished.join();
    std::cout << "[engine] acquisition started (" << source_->get_name() << ")\n";
}

// From the acquisition thread itself (failure handler) only the request is
// recorded; the thread is joined by a later stop() or start() elsewhere
void AcquisitionEngine::stop() {
    stop_requested_ = true;
    std::thread loop;
    std::thread retired;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        const std::thread::id self = std::this_thread::get_id();
        if (thread_.joinable() && thread_.get_id() != self) loop = std::move(thread_);
        if (retired_.joinable() && retired_.get_id() != self) retired = std::move(retired_);
    }
    if (loop.joinable()) {
        loop.join();
        std::cout << "[engine] acquisition stopped\n";
    }
    if (retired.joinable()) retired.join();
    queue_.notify_stop();
}

void AcquisitionEngine::acquisition_loop() {
    while (!stop_requested_) {
        try {
            cycle_locked();
        } catch (const DeviceFailureError&) {
            // mark_failed() already recorded it
            break;
        } catch (const std::exception& e) {
            std::cerr << "[engine] acquisition loop error: " << e.what() << "\n";
            mark_failed(DeviceFailureError(std::string("Acquisition loop error: ") + e.what()));
            break;
        }
    }
    running_ = false;
    queue_.notify_stop();
    notify_failure();
}

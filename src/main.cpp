// ============================================================================
// main.cpp - freqscan: live spectrum / waterfall acquisition from the terminal
// ============================================================================
#include "acquisition_engine.hpp"
#include "cli_options.hpp"
#include "simulated_sample_source.hpp"
#ifdef FREQSCAN_HAVE_UHD
#include "usrp_sample_source.hpp"
#endif
#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Global stop flag and signal handler
static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop = true; }

static std::unique_ptr<ISampleSource> make_source(const CliOptions& opt) {
    const DeviceConfig& cfg = opt.engine.initial;
    if (opt.simulate) {
        // A few carriers around the start frequency (or across the sweep)
        const double lo = opt.scanning() ? opt.scan_start_hz : cfg.hardware_freq_hz();
        const double hi = opt.scanning() ? opt.scan_stop_hz : cfg.hardware_freq_hz();
        std::vector<SimulatedTone> tones = {
            {lo + 0.25 * cfg.sample_rate_sps, 0.5f},
            {lo - 0.30 * cfg.sample_rate_sps, 0.05f},
            {(lo + hi) / 2.0 + 0.1 * cfg.sample_rate_sps, 0.2f},
        };
        return std::make_unique<SimulatedSampleSource>(tones);
    }
#ifdef FREQSCAN_HAVE_UHD
    return std::make_unique<UsrpSampleSource>(opt.device_args, opt.antenna, opt.subdev);
#else
    throw std::runtime_error("Built without UHD: only --sim is available");
#endif
}

static void print_row(const SpectrumRow& row) {
    size_t peak = 0;
    for (size_t i = 1; i < row.size(); i++) {
        if (row.bins_db[i] > row.bins_db[peak]) peak = i;
    }
    std::cout << "Row " << std::setw(6) << row.sequence
              << "  fc " << std::fixed << std::setprecision(3)
              << std::setw(9) << row.center_freq_hz / 1e6 << " MHz";
    if (row.scan_step >= 0) {
        std::cout << "  step " << std::setw(3) << row.scan_step;
    }
    if (row.size() > 0) {
        std::cout << "  peak " << std::setprecision(4) << row.bin_frequency(peak) / 1e6
                  << " MHz @ " << std::setprecision(1) << row.bins_db[peak] << " dB";
    }
    std::cout << "\n";
}

static void save_waterfall_csv(const std::vector<AcquisitionEngine::RowPtr>& rows,
                               const std::string& filename) {
    std::ofstream ofs(filename);
    if (!ofs) {
        std::cerr << "Failed to open CSV file: " << filename << "\n";
        return;
    }

    ofs << "# Waterfall snapshot, " << rows.size() << " rows, oldest first\n";
    ofs << "# sequence,frequency_Hz,power_dB\n";
    ofs << std::fixed << std::setprecision(6);
    for (const auto& row : rows) {
        for (size_t i = 0; i < row->size(); i++) {
            ofs << row->sequence << "," << row->bin_frequency(i) << ","
                << row->bins_db[i] << "\n";
        }
    }
    ofs.close();
    std::cout << "Waterfall saved to: " << filename << "\n";
}

int main(int argc, char** argv) {
    CliOptions opt;
    try {
        opt = parse_cli(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n";
        usage(std::cerr, argv[0]);
        return 1;
    }
    if (opt.show_help) {
        usage(std::cout, argv[0]);
        return 0;
    }

    try {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        AcquisitionEngine engine(make_source(opt), opt.engine);
        engine.set_failure_handler([](const DeviceFailureError&) { g_stop = true; });

        const DeviceConfig cfg = engine.current_config();
        std::cout << std::string(70, '=') << "\n"
                  << "Center:      " << std::fixed << std::setprecision(3)
                  << cfg.center_freq_hz / 1e6 << " MHz\n"
                  << "Offset:      " << cfg.freq_offset_hz / 1e6 << " MHz\n"
                  << "Span:        " << cfg.sample_rate_sps / 1e6 << " MHz\n"
                  << "Gain:        " << cfg.gain.to_string() << "\n"
                  << "FFT size:    " << cfg.fft_size << "\n"
                  << "Averaging:   " << averaging_mode_to_string(cfg.averaging) << "\n"
                  << std::string(70, '=') << "\n";

        if (opt.scanning()) {
            engine.start_scan(opt.scan_plan());
        }
        engine.start();

        AcquisitionEngine::RowPtr row;
        size_t rows = 0;
        while (!g_stop) {
            if (!engine.row_queue().pop(row, 0.5)) {
                if (!engine.running()) break;
                continue;
            }
            print_row(*row);
            if (opt.max_rows > 0 && ++rows >= opt.max_rows) break;
        }

        engine.stop_scan();
        engine.stop();

        if (!opt.save_csv.empty()) {
            save_waterfall_csv(engine.waterfall_snapshot(), opt.save_csv);
        }

        const EngineStats stats = engine.stats();
        std::cout << "\n" << std::string(70, '=') << "\n"
                  << "FINAL STATISTICS\n"
                  << std::string(70, '=') << "\n"
                  << "Cycles:        " << stats.cycles << "\n"
                  << "Rows:          " << stats.rows << "\n"
                  << "Timeouts:      " << stats.timeouts << "\n"
                  << "Mismatches:    " << stats.mismatches << "\n"
                  << "Stale rows:    " << stats.stale_rows << "\n"
                  << "Queue drops:   " << engine.row_queue().dropped() << "\n"
                  << std::string(70, '=') << "\n";

        if (engine.failed()) {
            std::cerr << "Fatal: " << engine.last_error() << std::endl;
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

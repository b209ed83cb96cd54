// ============================================================================
// cli_options.hpp - Command line options of the freqscan program
// ============================================================================
#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "acquisition_engine.hpp"
#include <chrono>
#include <iosfwd>
#include <string>

struct CliOptions {
    EngineOptions engine{};

    bool simulate{false};
    std::string device_args{"type=b200"};
    std::string antenna{"TX/RX"};
    std::string subdev{};

    // Sweep; disabled while scan_step_hz == 0
    double scan_start_hz{0.0};
    double scan_stop_hz{0.0};
    double scan_step_hz{0.0};
    std::chrono::milliseconds dwell{250};
    ScanEndPolicy scan_end{ScanEndPolicy::Wrap};

    size_t max_rows{0};          // 0 = run until interrupted
    std::string save_csv{};
    bool show_help{false};

    bool scanning() const { return scan_step_hz > 0.0; }
    ScanPlan scan_plan() const;
};

// Throws std::invalid_argument on an unknown flag, a missing or malformed value
CliOptions parse_cli(int argc, char** argv);

// "AUTO" or a gain in dB
GainSetting parse_gain(const std::string& text);

void usage(std::ostream& os, const char* prog);

#endif // CLI_OPTIONS_HPP

// ============================================================================
// cli_options.cpp - argv parsing for the freqscan program
// ============================================================================
#include "cli_options.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double to_double(const std::string& flag, const std::string& text) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": not a number: '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + ": not a number: '" + text + "'");
    }
    return v;
}

size_t to_size(const std::string& flag, const std::string& text) {
    const double v = to_double(flag, text);
    // Bound first: converting an out-of-range double to size_t is undefined
    if (!(v >= 0.0 && v < static_cast<double>(std::numeric_limits<size_t>::max()))
        || v != std::floor(v)) {
        throw std::invalid_argument(flag + ": expected a non-negative integer: '" + text + "'");
    }
    return static_cast<size_t>(v);
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t end = text.find(sep, begin);
        parts.push_back(text.substr(begin, end - begin));
        if (end == std::string::npos) break;
        begin = end + 1;
    }
    return parts;
}

PeakHoldMode string_to_peak_hold(const std::string& text) {
    const std::string s = lower(text);
    if (s == "off") return PeakHoldMode::Off;
    if (s == "decay") return PeakHoldMode::Decay;
    if (s == "hold") return PeakHoldMode::Hold;
    throw std::invalid_argument("--peak: expected off, decay or hold: '" + text + "'");
}

} // namespace

GainSetting parse_gain(const std::string& text) {
    if (lower(text) == "auto") return GainSetting::make_auto();
    return GainSetting::manual(to_double("--gain", text));
}

ScanPlan CliOptions::scan_plan() const {
    return ScanPlan::from_range(scan_start_hz, scan_stop_hz, scan_step_hz, dwell, scan_end);
}

CliOptions parse_cli(int argc, char** argv) {
    CliOptions opt;
    DeviceConfig& cfg = opt.engine.initial;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(a + ": missing value");
            }
            return argv[++i];
        };

        if (a == "--help" || a == "-h") opt.show_help = true;
        else if (a == "--sim") opt.simulate = true;
        else if (a == "--verbose") opt.engine.verbose = true;
        else if (a == "--wrap") opt.scan_end = ScanEndPolicy::Wrap;
        else if (a == "--once") opt.scan_end = ScanEndPolicy::Stop;
        else if (a == "--dev") opt.device_args = value();
        else if (a == "--antenna") opt.antenna = value();
        else if (a == "--subdev") opt.subdev = value();
        else if (a == "--fc") cfg.center_freq_hz = to_double(a, value());
        else if (a == "--fs") cfg.sample_rate_sps = to_double(a, value());
        else if (a == "--offset") cfg.freq_offset_hz = to_double(a, value());
        else if (a == "--gain") cfg.gain = parse_gain(value());
        else if (a == "--fft") cfg.fft_size = to_size(a, value());
        else if (a == "--history") opt.engine.history_rows = to_size(a, value());
        else if (a == "--decimate") opt.engine.row_decimation = to_size(a, value());
        else if (a == "--window") opt.engine.window = string_to_window_type(value());
        else if (a == "--floor") opt.engine.floor_db = static_cast<float>(to_double(a, value()));
        else if (a == "--peak") opt.engine.peak_hold = string_to_peak_hold(value());
        else if (a == "--reject") opt.engine.range_policy = RangePolicy::Reject;
        else if (a == "--rows") opt.max_rows = to_size(a, value());
        else if (a == "--save-csv") opt.save_csv = value();
        else if (a == "--timeout") {
            opt.engine.read_timeout = std::chrono::milliseconds(to_size(a, value()));
        } else if (a == "--dwell") {
            opt.dwell = std::chrono::milliseconds(to_size(a, value()));
        } else if (a == "--avg") {
            // mode[:factor], e.g. exp:0.7 or block:8
            const std::vector<std::string> parts = split(value(), ':');
            if (parts.size() > 2) {
                throw std::invalid_argument("--avg: expected mode[:factor]");
            }
            cfg.averaging = string_to_averaging_mode(parts[0]);
            cfg.averaging_factor = parts.size() == 2 ? to_double(a, parts[1]) : 0.0;
            if (cfg.averaging == AveragingMode::Block && parts.size() == 1) {
                cfg.averaging_factor = 4.0;
            } else if (cfg.averaging == AveragingMode::Exponential && parts.size() == 1) {
                cfg.averaging_factor = 0.5;
            }
        } else if (a == "--scan") {
            const std::vector<std::string> parts = split(value(), ':');
            if (parts.size() != 3) {
                throw std::invalid_argument("--scan: expected start:stop:step in Hz");
            }
            opt.scan_start_hz = to_double(a, parts[0]);
            opt.scan_stop_hz = to_double(a, parts[1]);
            opt.scan_step_hz = to_double(a, parts[2]);
            if (opt.scan_step_hz <= 0.0 || opt.scan_stop_hz < opt.scan_start_hz) {
                throw std::invalid_argument("--scan: need step > 0 and stop >= start");
            }
        } else {
            throw std::invalid_argument("Unknown option: " + a);
        }
    }

    if (opt.scanning()) {
        cfg.center_freq_hz = opt.scan_start_hz;
    }
    return opt;
}

void usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " [--sim | --dev <args>] [options]\n"
       << "Example: " << prog << " --dev \"type=b200\" --fc 100e6 --fs 2.4e6 --gain 30 --fft 2048\n"
       << "         " << prog << " --sim --scan 88e6:108e6:2e6 --dwell 300 --rows 200\n"
       << "\nDevice:\n"
       << "  --sim               : Simulated RTL-SDR style receiver, no hardware\n"
       << "  --dev <args>        : USRP device arguments (default: \"type=b200\")\n"
       << "  --antenna <name>    : RX antenna (default: TX/RX)\n"
       << "  --subdev <spec>     : RX subdevice spec (optional)\n"
       << "\nTuning:\n"
       << "  --fc <Hz>           : Center frequency (default: 145e6)\n"
       << "  --fs <sps>          : Sample rate = displayed span (default: 2.4e6)\n"
       << "  --offset <Hz>       : Up/down converter offset, e.g. 125e6 (default: 0)\n"
       << "  --gain <dB|AUTO>    : RX gain step or AUTO (default: AUTO)\n"
       << "  --reject            : Reject out-of-range frequencies instead of clamping\n"
       << "\nSpectrum:\n"
       << "  --fft <N>           : FFT size, power of 2 (default: 1024)\n"
       << "  --window <type>     : rect | hann | hamming | blackman (default: hann)\n"
       << "  --avg <mode[:k]>    : none | exp:<0..1) | block:<M> (default: none)\n"
       << "  --floor <dB>        : Lowest reported power (default: -200)\n"
       << "  --timeout <ms>      : Block read deadline (default: 200)\n"
       << "\nWaterfall:\n"
       << "  --history <rows>    : Rows kept (default: 256)\n"
       << "  --decimate <n>      : Store every n-th row (default: 1)\n"
       << "  --peak <mode>       : off | decay | hold (default: off)\n"
       << "\nScan:\n"
       << "  --scan <a:b:step>   : Sweep centers a, a+step, ... b (Hz)\n"
       << "  --dwell <ms>        : Time per step (default: 250)\n"
       << "  --wrap | --once     : Restart the sweep or stop after the last step\n"
       << "\nOutput:\n"
       << "  --rows <n>          : Exit after n rows (default: until Ctrl-C)\n"
       << "  --save-csv <file>   : Save the waterfall as sequence,frequency_Hz,power_dB\n"
       << "  --verbose           : Per-row diagnostics\n"
       << "  --help              : This text\n";
}

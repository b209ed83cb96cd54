// ============================================================================
// usrp_sample_source.cpp - USRP receive path with exact-size block reads
// ============================================================================
#include "usrp_sample_source.hpp"
#include "scan_errors.hpp"
#include <uhd/exception.hpp>
#include <uhd/types/tune_request.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>

// ---------------- Construction ----------------
UsrpSampleSource::UsrpSampleSource(const std::string& device_args,
                                   const std::string& antenna,
                                   const std::string& subdev)
    : ant_(antenna), subdev_(subdev)
{
    try {
        std::cout << "Creating USRP sample source..." << std::endl;
        usrp_ = uhd::usrp::multi_usrp::make(device_args);

        if (!subdev_.empty()) {
            std::cout << "Setting subdevice: " << subdev_ << std::endl;
            usrp_->set_rx_subdev_spec(subdev_);
        }

        std::cout << "Setting antenna: " << ant_ << std::endl;
        usrp_->set_rx_antenna(ant_);

        uhd::stream_args_t stream_args("fc32"); // complex float32
        rx_streamer_ = usrp_->get_rx_stream(stream_args);
        caps_ = query_capabilities();
        std::cout << "USRP ready: " << usrp_->get_pp_string() << std::endl;
    } catch (const uhd::exception& e) {
        throw DeviceFailureError(std::string("USRP init failed: ") + e.what());
    }

    // Devices without an AGC reject set_rx_agc(); auto gain is refused there
    try {
        usrp_->set_rx_agc(false);
        agc_supported_ = true;
    } catch (const uhd::exception& e) {
        agc_supported_ = false;
        std::cout << "AGC not available, manual gain only (" << e.what() << ")" << std::endl;
    }
}

UsrpSampleSource::~UsrpSampleSource() {
    try {
        stop();
    } catch (const uhd::exception& e) {
        std::cerr << "USRP stop failed: " << e.what() << std::endl;
    }
}

std::string UsrpSampleSource::get_name() const {
    return "usrp(" + usrp_->get_mboard_name() + ")";
}

SourceCapabilities UsrpSampleSource::query_capabilities() const {
    SourceCapabilities caps;

    uhd::freq_range_t freq_range = usrp_->get_rx_freq_range();
    caps.tuning_range = FreqRange{freq_range.start(), freq_range.stop()};

    for (const auto& r : usrp_->get_rx_rates()) {
        caps.sample_rates.push_back(FreqRange{r.start(), r.stop()});
    }

    // Enumerate discrete gain steps; ranges without a step use whole dB
    uhd::gain_range_t gains = usrp_->get_rx_gain_range();
    double step = gains.step() > 0.0 ? gains.step() : 1.0;
    for (double g = gains.start(); g <= gains.stop() + 1e-9; g += step) {
        caps.gain_steps_db.push_back(g);
    }
    return caps;
}

// ---------------- Configuration ----------------
AppliedTuning UsrpSampleSource::configure(double center_freq_hz,
                                          double sample_rate_sps,
                                          const GainSetting& gain) {
    if (gain.automatic && !agc_supported_) {
        throw InvalidGainError("Automatic gain not available on " + get_name());
    }

    try {
        stop();

        if (sample_rate_sps != sps_) {
            usrp_->set_rx_rate(sample_rate_sps);
            sps_ = usrp_->get_rx_rate();
        }
        if (center_freq_hz != freq_) {
            usrp_->set_rx_freq(uhd::tune_request_t(center_freq_hz));
            freq_ = usrp_->get_rx_freq();
        }
    } catch (const uhd::exception& e) {
        throw DeviceFailureError(std::string("USRP configure failed: ") + e.what());
    }

    if (gain.automatic) {
        try {
            usrp_->set_rx_agc(true);
        } catch (const uhd::exception& e) {
            throw DeviceFailureError(std::string("USRP enable AGC failed: ") + e.what());
        }
        return AppliedTuning{freq_, sps_};
    }

    try {
        if (agc_supported_) {
            usrp_->set_rx_agc(false);
        }
        usrp_->set_rx_gain(gain.value_db);
        gain_ = usrp_->get_rx_gain();
    } catch (const uhd::exception& e) {
        throw DeviceFailureError(std::string("USRP set gain failed: ") + e.what());
    }
    return AppliedTuning{freq_, sps_};
}

// ---------------- Streaming ----------------
void UsrpSampleSource::start() {
    if (streaming_) return;
    uhd::stream_cmd_t cmd(uhd::stream_cmd_t::STREAM_MODE_START_CONTINUOUS);
    cmd.stream_now = true;
    cmd.num_samps = 0;
    rx_streamer_->issue_stream_cmd(cmd);
    streaming_ = true;
}

void UsrpSampleSource::stop() {
    if (!streaming_) return;
    uhd::stream_cmd_t cmd(uhd::stream_cmd_t::STREAM_MODE_STOP_CONTINUOUS);
    rx_streamer_->issue_stream_cmd(cmd);
    streaming_ = false;

    // Drain samples still in flight from the previous configuration
    std::vector<std::complex<float>> scratch(rx_streamer_->get_max_num_samps());
    uhd::rx_metadata_t md;
    while (rx_streamer_->recv(scratch.data(), scratch.size(), md, 0.05) > 0) {
    }
}

SampleBlock UsrpSampleSource::read_block(size_t n, std::chrono::milliseconds timeout) {
    SampleBlock block;
    block.samples.resize(n);
    block.center_freq_hz = freq_;
    block.sample_rate_sps = sps_;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t total = 0;

    try {
        start();
        while (total < n) {
            double remaining =
                std::chrono::duration<double>(
                    deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0.0) {
                throw TimeoutError("USRP read: " + std::to_string(total) + " of "
                                   + std::to_string(n) + " samples before deadline");
            }

            std::complex<float>* ptr = block.samples.data() + total;
            size_t got = rx_streamer_->recv(ptr, n - total, md_, std::min(remaining, 0.2), false);

            if (md_.error_code == uhd::rx_metadata_t::ERROR_CODE_TIMEOUT) continue;
            if (md_.error_code == uhd::rx_metadata_t::ERROR_CODE_OVERFLOW) {
                total = 0;   // samples were lost, start the block again
                continue;
            }
            if (md_.error_code != uhd::rx_metadata_t::ERROR_CODE_NONE) {
                throw DeviceFailureError("USRP receive error: " + md_.strerror());
            }
            total += got;
        }
    } catch (const uhd::exception& e) {
        streaming_ = false;
        throw DeviceFailureError(std::string("USRP receive failed: ") + e.what());
    }

    block.captured_at = Clock::now();
    return block;
}

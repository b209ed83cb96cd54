// ============================================================================
// usrp_sample_source.hpp - USRP receiver behind the ISampleSource interface
// ============================================================================
#ifndef USRP_SAMPLE_SOURCE_HPP
#define USRP_SAMPLE_SOURCE_HPP

#include "sample_source.hpp"
#include <uhd/usrp/multi_usrp.hpp>
#include <uhd/stream.hpp>
#include <atomic>
#include <complex>
#include <string>
#include <vector>

class UsrpSampleSource : public ISampleSource {
public:
    UsrpSampleSource(const std::string& device_args,
                     const std::string& antenna = "TX/RX",
                     const std::string& subdev = "");
    ~UsrpSampleSource() override;

    SourceCapabilities capabilities() const override { return caps_; }

    // Stops streaming, retunes, and leaves the stream stopped; the next
    // read_block() restarts it so no pre-change samples reach a block
    AppliedTuning configure(double center_freq_hz,
                            double sample_rate_sps,
                            const GainSetting& gain) override;

    // Reads exactly num_samples contiguous samples or throws TimeoutError.
    // An overflow restarts the block.
    SampleBlock read_block(size_t num_samples,
                           std::chrono::milliseconds timeout) override;

    std::string get_name() const override;

    double actual_sample_rate() const { return sps_; }
    double actual_center_freq() const { return freq_; }
    double actual_gain() const { return gain_; }

private:
    void start();
    void stop();
    SourceCapabilities query_capabilities() const;

    uhd::usrp::multi_usrp::sptr usrp_;
    uhd::rx_streamer::sptr rx_streamer_;
    uhd::rx_metadata_t md_{};
    SourceCapabilities caps_;

    double freq_{0.0};
    double sps_{0.0};
    double gain_{0.0};
    std::string ant_{"TX/RX"};
    std::string subdev_{};

    bool agc_supported_{false};
    std::atomic<bool> streaming_{false};
};

#endif // USRP_SAMPLE_SOURCE_HPP

// ============================================================================
// test_scan_controller.cpp
// ============================================================================
#include "scan_controller.hpp"
#include "scan_errors.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

bool wait_for(const std::function<bool()>& pred,
              std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

// Records every tune request; optionally refuses frequencies at or above limit_hz
class TuneRecorder {
public:
    double tune(double freq_hz) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (device_gone_) {
            throw DeviceFailureError("receiver gone");
        }
        if (freq_hz >= limit_hz_) {
            throw OutOfRangeError("refused");
        }
        tuned_.push_back(freq_hz);
        return freq_hz;
    }

    void set_limit(double hz) {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_hz_ = hz;
    }

    void set_device_gone(bool gone) {
        std::lock_guard<std::mutex> lock(mutex_);
        device_gone_ = gone;
    }

    std::vector<double> tuned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tuned_;
    }

    ScanController::TuneFunction fn() {
        return [this](double hz) { return tune(hz); };
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> tuned_;
    double limit_hz_{1e12};
    bool device_gone_{false};
};

} // namespace

TEST(ScanPlanTest, FromRangeIncludesStop) {
    const ScanPlan plan = ScanPlan::from_range(100.0e6, 104.0e6, 1.0e6, 50ms);
    ASSERT_EQ(plan.size(), 5u);
    EXPECT_DOUBLE_EQ(plan.steps.front().freq_hz, 100.0e6);
    EXPECT_DOUBLE_EQ(plan.steps.back().freq_hz, 104.0e6);
    EXPECT_EQ(plan.steps[2].dwell, 50ms);
    EXPECT_EQ(plan.end_policy, ScanEndPolicy::Wrap);
}

TEST(ScanPlanTest, FromRangeSingleStep) {
    const ScanPlan plan = ScanPlan::from_range(100.0e6, 100.4e6, 1.0e6, 50ms);
    ASSERT_EQ(plan.size(), 1u);
}

TEST(ScanPlanTest, FromRangeRejectsBadArguments) {
    EXPECT_THROW(ScanPlan::from_range(100.0e6, 104.0e6, 0.0, 50ms), std::invalid_argument);
    EXPECT_THROW(ScanPlan::from_range(104.0e6, 100.0e6, 1.0e6, 50ms), std::invalid_argument);
}

TEST(ScanControllerTest, StartTunesFirstStepImmediately) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    EXPECT_EQ(scan.state(), ScanState::Idle);
    EXPECT_EQ(scan.current_step(), -1);

    scan.start(ScanPlan::from_range(100.0e6, 102.0e6, 1.0e6, 1000ms));
    EXPECT_EQ(scan.state(), ScanState::Scanning);
    EXPECT_EQ(scan.current_step(), 0);
    ASSERT_EQ(rec.tuned().size(), 1u);
    EXPECT_DOUBLE_EQ(rec.tuned()[0], 100.0e6);
    EXPECT_EQ(scan.step_for_center(100.0e6), 0);
    EXPECT_EQ(scan.step_for_center(101.0e6), -1);
}

TEST(ScanControllerTest, AdvancesInOrderAndWraps) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 101.0e6, 1.0e6, 10ms));

    ASSERT_TRUE(wait_for([&] { return scan.steps_advanced() >= 3; }));
    scan.stop();

    const std::vector<double> tuned = rec.tuned();
    ASSERT_GE(tuned.size(), 4u);
    EXPECT_DOUBLE_EQ(tuned[0], 100.0e6);
    EXPECT_DOUBLE_EQ(tuned[1], 101.0e6);
    EXPECT_DOUBLE_EQ(tuned[2], 100.0e6);
    EXPECT_DOUBLE_EQ(tuned[3], 101.0e6);
}

TEST(ScanControllerTest, StopPolicyEndsIdleAfterLastStep) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 101.0e6, 1.0e6, 10ms, ScanEndPolicy::Stop));

    ASSERT_TRUE(wait_for([&] { return scan.state() == ScanState::Idle; }));
    EXPECT_EQ(rec.tuned().size(), 2u);
    EXPECT_EQ(scan.current_step(), -1);
}

TEST(ScanControllerTest, StopCancelsPendingDwell) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 105.0e6, 1.0e6, 40ms));
    scan.stop();

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(scan.state(), ScanState::Idle);
    EXPECT_EQ(scan.steps_advanced(), 0u);
    EXPECT_EQ(rec.tuned().size(), 1u);
}

TEST(ScanControllerTest, PauseHoldsCurrentStep) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 105.0e6, 1.0e6, 30ms));
    scan.pause();
    EXPECT_EQ(scan.state(), ScanState::Paused);

    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(scan.steps_advanced(), 0u);
    EXPECT_EQ(scan.current_step(), 0);

    scan.resume();
    EXPECT_EQ(scan.state(), ScanState::Scanning);
    ASSERT_TRUE(wait_for([&] { return scan.steps_advanced() >= 1; }));
    EXPECT_DOUBLE_EQ(rec.tuned()[1], 101.0e6);
}

TEST(ScanControllerTest, TuneFailureStopsSweep) {
    TuneRecorder rec;
    rec.set_limit(101.0e6);
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 102.0e6, 1.0e6, 10ms));

    ASSERT_TRUE(wait_for([&] { return scan.state() == ScanState::Idle; }));
    EXPECT_EQ(scan.steps_advanced(), 0u);
    EXPECT_EQ(rec.tuned().size(), 1u);
}

TEST(ScanControllerTest, FailedFirstTuneThrows) {
    TuneRecorder rec;
    rec.set_limit(50.0e6);
    ScanController scan(rec.fn());
    EXPECT_THROW(scan.start(ScanPlan::from_range(100.0e6, 102.0e6, 1.0e6, 10ms)),
                 OutOfRangeError);
    EXPECT_EQ(scan.state(), ScanState::Idle);
}

TEST(ScanControllerTest, FailedRestartClearsPreviousStep) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 104.0e6, 1.0e6, 10ms));
    ASSERT_TRUE(wait_for([&] { return scan.steps_advanced() >= 3; }));
    scan.pause();
    ASSERT_GE(scan.current_step(), 0);

    rec.set_limit(150.0e6);
    EXPECT_THROW(scan.start(ScanPlan::from_range(200.0e6, 200.0e6, 1.0e6, 10ms)),
                 OutOfRangeError);
    EXPECT_EQ(scan.state(), ScanState::Idle);
    EXPECT_EQ(scan.plan().size(), 1u);
    EXPECT_EQ(scan.current_step(), -1);

    // Rows still arriving at the old frequency belong to no step
    const double last = rec.tuned().back();
    EXPECT_EQ(scan.step_for_center(last), -1);
    auto row = std::make_shared<SpectrumRow>();
    row->scan_step = 3;
    scan.record_row(row);
    EXPECT_EQ(scan.sweep_rows()[0], nullptr);
}

TEST(ScanControllerTest, DeviceFailureReportedOnce) {
    TuneRecorder rec;
    std::mutex mutex;
    std::vector<std::string> failures;
    ScanController scan(rec.fn(), [&](const DeviceFailureError& e) {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back(e.what());
    });
    scan.start(ScanPlan::from_range(100.0e6, 102.0e6, 1.0e6, 10ms));
    rec.set_device_gone(true);

    ASSERT_TRUE(wait_for([&] { return scan.state() == ScanState::Idle; }));
    std::this_thread::sleep_for(50ms);
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "receiver gone");
    EXPECT_EQ(scan.current_step(), -1);
}

TEST(ScanControllerTest, RejectsEmptyPlanAndZeroDwell) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    EXPECT_THROW(scan.start(ScanPlan{}), std::invalid_argument);

    ScanPlan plan;
    plan.steps.push_back(ScanStep{100.0e6, 0ms});
    EXPECT_THROW(scan.start(plan), std::invalid_argument);
    EXPECT_TRUE(rec.tuned().empty());
}

TEST(ScanControllerTest, KeepsLatestRowPerStep) {
    TuneRecorder rec;
    ScanController scan(rec.fn());
    scan.start(ScanPlan::from_range(100.0e6, 102.0e6, 1.0e6, 1000ms));

    auto row = std::make_shared<SpectrumRow>();
    row->scan_step = 0;
    row->sequence = 7;
    scan.record_row(row);

    auto untagged = std::make_shared<SpectrumRow>();
    scan.record_row(untagged);

    const auto rows = scan.sweep_rows();
    ASSERT_EQ(rows.size(), 3u);
    ASSERT_NE(rows[0], nullptr);
    EXPECT_EQ(rows[0]->sequence, 7u);
    EXPECT_EQ(rows[1], nullptr);
}

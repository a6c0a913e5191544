#include "acquisition_loop.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

std::vector<unsigned char> pen_report(uint16_t x) {
    return {0x07, 0x09, static_cast<unsigned char>(x & 0xff), static_cast<unsigned char>(x >> 8),
            0x64, 0x00, 0x00, 0x20, 0x00, 0x00};
}

class RecordingSink : public SampleSink {
public:
    struct Record {
        std::vector<StylusSample> samples;
        int closes = 0;
        std::shared_ptr<UsbCallLog> log;
    };

    RecordingSink(std::shared_ptr<Record> record, bool healthy = true)
        : record(std::move(record)), healthy(healthy) {}

    std::string describe() const override { return "recording"; }
    bool forward(const StylusSample& sample) override {
        record->samples.push_back(sample);
        return healthy;
    }
    void close() override {
        record->closes++;
        if (record->log) record->log->calls.push_back("close sinks");
    }

private:
    std::shared_ptr<Record> record;
    bool healthy;
};

class AcquisitionLoopTest : public ::testing::Test {
protected:
    FakeUsbBus bus;
    TabletBinder binder{default_binder_options()};
    std::atomic<bool> running{true};
    std::shared_ptr<RecordingSink::Record> record = std::make_shared<RecordingSink::Record>();
    std::vector<int> sleeps;
    int factory_calls = 0;
    bool factory_ok = true;
    bool add_sink = true;
    bool sink_healthy = true;
    LoopOptions options;

    void SetUp() override {
        record->log = bus.log;
        binder.set_command_runner([this](const std::string& command, std::string& output) {
            bus.log->calls.push_back("reset " + command);
            output.clear();
            return 0;
        });
    }

    AcquisitionLoop make_loop() {
        SinkFactory factory = [this](SinkRegistry& sinks) {
            factory_calls++;
            if (add_sink) {
                sinks.add(std::make_unique<RecordingSink>(record, sink_healthy));
            }
            return factory_ok;
        };
        AcquisitionLoop loop(bus, binder, factory, options, running);
        loop.set_sleep_function([this](int ms) { sleeps.push_back(ms); });
        return loop;
    }

    FakeUsbDevice device() { return FakeUsbDevice({1, 5}, bus.log); }

    bool reset_ran() const {
        for (const auto& call : bus.log->calls) {
            if (call.rfind("reset ", 0) == 0) return true;
        }
        return false;
    }
    size_t reset_index() const {
        for (size_t i = 0; i < bus.log->calls.size(); i++) {
            if (bus.log->calls[i].rfind("reset ", 0) == 0) return i;
        }
        return bus.log->calls.size();
    }
};

} // namespace

TEST(SessionEnd, TransientReadErrors) {
    EXPECT_TRUE(is_transient_read_error(LIBUSB_ERROR_TIMEOUT));
    EXPECT_TRUE(is_transient_read_error(LIBUSB_ERROR_INTERRUPTED));
    EXPECT_FALSE(is_transient_read_error(LIBUSB_ERROR_NO_DEVICE));
    EXPECT_FALSE(is_transient_read_error(LIBUSB_ERROR_IO));
    EXPECT_FALSE(is_transient_read_error(LIBUSB_ERROR_PIPE));
}

TEST_F(AcquisitionLoopTest, ClaimFailureStillRunsEveryTeardownStep) {
    options.force_detach = true;
    auto loop = make_loop();
    auto dev = device();
    dev.kernel_driver_rc = 1;
    dev.claim_rc = LIBUSB_ERROR_BUSY;

    EXPECT_EQ(loop.serve_device(dev), SessionEnd::BindFailed);
    EXPECT_EQ(factory_calls, 0);

    const auto& log = *bus.log;
    ASSERT_TRUE(log.contains("release"));
    ASSERT_TRUE(log.contains("attach"));
    ASSERT_TRUE(reset_ran());
    EXPECT_LT(log.index_of("claim"), log.index_of("release"));
    EXPECT_LT(log.index_of("release"), log.index_of("attach"));
    EXPECT_LT(log.index_of("attach"), reset_index());
    EXPECT_EQ(log.count("release"), 1u);
    EXPECT_EQ(log.count("dispose"), 1u);
}

TEST_F(AcquisitionLoopTest, NoReattachWhenNothingWasDetached) {
    auto loop = make_loop();
    auto dev = device();
    dev.claim_rc = LIBUSB_ERROR_ACCESS;
    loop.serve_device(dev);
    EXPECT_FALSE(bus.log->contains("attach"));
    EXPECT_TRUE(bus.log->contains("release"));
    EXPECT_TRUE(reset_ran());
}

TEST_F(AcquisitionLoopTest, SkipSetAltLeavesInterfaceAlone) {
    options.skip_set_alt = true;
    auto loop = make_loop();
    auto dev = device();
    loop.serve_device(dev);
    EXPECT_FALSE(reset_ran());
    EXPECT_TRUE(bus.log->contains("release"));
}

TEST_F(AcquisitionLoopTest, UnlockFailureAbortsBeforeClaim) {
    auto loop = make_loop();
    auto dev = device();
    dev.set_configuration_rc = LIBUSB_ERROR_IO;
    EXPECT_EQ(loop.serve_device(dev), SessionEnd::BindFailed);
    EXPECT_FALSE(bus.log->contains("claim"));
    EXPECT_TRUE(bus.log->contains("release"));
    EXPECT_TRUE(reset_ran());
}

TEST_F(AcquisitionLoopTest, DetachFailureAbortsSession) {
    options.force_detach = true;
    auto loop = make_loop();
    auto dev = device();
    dev.kernel_driver_rc = 1;
    dev.detach_rc = LIBUSB_ERROR_ACCESS;
    EXPECT_EQ(loop.serve_device(dev), SessionEnd::BindFailed);
    EXPECT_FALSE(bus.log->contains("claim"));
    EXPECT_FALSE(bus.log->contains("attach"));
}

TEST_F(AcquisitionLoopTest, TimeoutsAreRetriedSilently) {
    LogCapture capture;
    auto loop = make_loop();
    auto dev = device();
    dev.reads = {{LIBUSB_ERROR_TIMEOUT, {}},
                 {LIBUSB_ERROR_TIMEOUT, {}},
                 {LIBUSB_SUCCESS, pen_report(10)},
                 {LIBUSB_ERROR_INTERRUPTED, {}},
                 {LIBUSB_SUCCESS, {}},
                 {LIBUSB_SUCCESS, pen_report(20)}};

    EXPECT_EQ(loop.serve_device(dev), SessionEnd::TransportError);
    ASSERT_EQ(record->samples.size(), 2u);
    EXPECT_EQ(record->samples[0].x, 10);
    EXPECT_EQ(record->samples[1].x, 20);
    EXPECT_EQ(loop.get_session_samples(), 2u);
    EXPECT_EQ(capture.count(LogLevel::Error), 0u);
}

TEST_F(AcquisitionLoopTest, TimedOutReadWithDataIsDecoded) {
    LogCapture capture;
    auto loop = make_loop();
    auto dev = device();
    dev.reads = {{LIBUSB_ERROR_TIMEOUT, pen_report(42)},
                 {LIBUSB_ERROR_TIMEOUT, {}}};

    EXPECT_EQ(loop.serve_device(dev), SessionEnd::TransportError);
    ASSERT_EQ(record->samples.size(), 1u);
    EXPECT_EQ(record->samples[0].x, 42);
    EXPECT_EQ(capture.count(LogLevel::Error), 0u);
}

TEST_F(AcquisitionLoopTest, RejectedReportsAreDropped) {
    auto loop = make_loop();
    auto dev = device();
    auto wrong_id = pen_report(1);
    wrong_id[0] = 0x02;
    dev.reads = {{LIBUSB_SUCCESS, wrong_id},
                 {LIBUSB_SUCCESS, {0x07, 0x09, 0x00}},
                 {LIBUSB_SUCCESS, pen_report(3)}};

    loop.serve_device(dev);
    ASSERT_EQ(record->samples.size(), 1u);
    EXPECT_EQ(record->samples[0].x, 3);
}

TEST_F(AcquisitionLoopTest, SinksCloseBeforeRelease) {
    auto loop = make_loop();
    auto dev = device();
    dev.reads = {{LIBUSB_SUCCESS, pen_report(1)}};
    loop.serve_device(dev);

    EXPECT_EQ(record->closes, 1);
    EXPECT_LT(bus.log->index_of("close sinks"), bus.log->index_of("release"));
    EXPECT_LT(bus.log->index_of("release"), reset_index());
}

TEST_F(AcquisitionLoopTest, NoSinksAbortsBeforeStreaming) {
    add_sink = false;
    auto loop = make_loop();
    auto dev = device();
    dev.reads = {{LIBUSB_SUCCESS, pen_report(1)}};

    EXPECT_EQ(loop.serve_device(dev), SessionEnd::NoSinks);
    EXPECT_FALSE(bus.log->contains("read exhausted"));
    EXPECT_EQ(dev.reads.size(), 1u);
    EXPECT_TRUE(bus.log->contains("release"));
}

TEST_F(AcquisitionLoopTest, SinkSetupFailureClosesWhatWasBuilt) {
    factory_ok = false;
    auto loop = make_loop();
    auto dev = device();
    EXPECT_EQ(loop.serve_device(dev), SessionEnd::SinkSetupFailed);
    EXPECT_EQ(record->closes, 1);
    EXPECT_TRUE(bus.log->contains("release"));
    EXPECT_TRUE(reset_ran());
}

TEST_F(AcquisitionLoopTest, FailingSinkEndsSession) {
    sink_healthy = false;
    auto loop = make_loop();
    auto dev = device();
    dev.reads = {{LIBUSB_SUCCESS, pen_report(1)}, {LIBUSB_SUCCESS, pen_report(2)}};

    EXPECT_EQ(loop.serve_device(dev), SessionEnd::SinkFailure);
    EXPECT_EQ(record->samples.size(), 1u);
    EXPECT_EQ(dev.reads.size(), 1u);
    EXPECT_TRUE(bus.log->contains("release"));
}

TEST_F(AcquisitionLoopTest, StopFlagEndsStreaming) {
    auto loop = make_loop();
    auto dev = device();
    running = false;
    dev.reads = {{LIBUSB_SUCCESS, pen_report(1)}};
    EXPECT_EQ(loop.serve_device(dev), SessionEnd::Stopped);
    EXPECT_TRUE(record->samples.empty());
    EXPECT_TRUE(bus.log->contains("release"));
}

TEST_F(AcquisitionLoopTest, DisconnectTearsDownAndRebindsAfterBackoff) {
    options.restart_delay_ms = 1000;
    bus.present = {{1, 5}};
    bus.setup = [](FakeUsbDevice& dev) {
        dev.reads = {{LIBUSB_SUCCESS, pen_report(7)}};
        dev.exhausted_rc = LIBUSB_ERROR_NO_DEVICE;
    };

    auto loop = make_loop();
    loop.set_sleep_function([this](int ms) {
        sleeps.push_back(ms);
        if (sleeps.size() == 2) {
            running = false;
        }
    });
    loop.run();

    EXPECT_EQ(loop.get_session_count(), 2);
    EXPECT_EQ(loop.get_total_samples(), 2u);
    EXPECT_EQ(bus.scans, 2);
    EXPECT_EQ(sleeps, (std::vector<int>{1000, 1000}));
    EXPECT_EQ(bus.log->count("release"), 2u);
    EXPECT_EQ(bus.log->count("dispose"), 2u);

    // The second scan only happens after the first session was torn down
    size_t second_scan = 0;
    for (size_t i = 0, seen = 0; i < bus.log->calls.size(); i++) {
        if (bus.log->calls[i] == "scan" && ++seen == 2) {
            second_scan = i;
        }
    }
    EXPECT_LT(reset_index(), second_scan);
}

TEST_F(AcquisitionLoopTest, MissingSelectedDeviceIsAnErrorAndWaitsScanInterval) {
    LogCapture capture;
    options.selector = BusAddress{0, 3};
    options.scan_interval_ms = 5000;
    bus.present = {{1, 5}};

    auto loop = make_loop();
    loop.set_sleep_function([this](int ms) {
        sleeps.push_back(ms);
        running = false;
    });
    loop.run();

    EXPECT_EQ(sleeps, (std::vector<int>{5000}));
    EXPECT_EQ(loop.get_session_count(), 0);
    EXPECT_TRUE(capture.contains("Device ugen0.3 not present; sleeping 5.0s"));
    EXPECT_EQ(capture.count(LogLevel::Error), 1u);
}

TEST_F(AcquisitionLoopTest, ScanningWithoutTabletLogsAtDebug) {
    LogCapture capture;
    options.scan_interval_ms = 2500;

    auto loop = make_loop();
    loop.set_sleep_function([this](int ms) {
        sleeps.push_back(ms);
        running = false;
    });
    loop.run();

    EXPECT_EQ(sleeps, (std::vector<int>{2500}));
    EXPECT_TRUE(capture.contains("Tablet not found; rescanning in 2.5s"));
    EXPECT_EQ(capture.count(LogLevel::Error), 0u);
}

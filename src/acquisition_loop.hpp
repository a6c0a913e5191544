#ifndef ACQUISITION_LOOP_HPP
#define ACQUISITION_LOOP_HPP

#include "sample_sink.hpp"
#include "tablet_binder.hpp"
#include "tablet_constants.hpp"
#include "usb_device.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

struct LoopOptions {
    std::optional<BusAddress> selector;
    int interface = STYLUS_INTERFACE;
    unsigned char endpoint = STYLUS_ENDPOINT;
    int read_size = STYLUS_READ_SIZE;
    unsigned int read_timeout_ms = 100;
    int scan_interval_ms = 5000;
    int restart_delay_ms = 1000;
    bool force_detach = false;
    bool skip_set_alt = false;
    bool verbose = false;
};

enum class SessionEnd {
    Stopped,
    BindFailed,
    SinkSetupFailed,
    NoSinks,
    TransportError,
    SinkFailure
};

const char* session_end_name(SessionEnd end);

// Read errors that only mean "nothing arrived in time".
bool is_transient_read_error(int rc);

// Fills the registry for a new session; false when a configured sink could not be set up.
using SinkFactory = std::function<bool(SinkRegistry&)>;
using SleepFunction = std::function<void(int milliseconds)>;

class AcquisitionLoop {
public:
    AcquisitionLoop(UsbBus& bus, const TabletBinder& binder, SinkFactory sink_factory,
                    LoopOptions options, std::atomic<bool>& running);

    void set_sleep_function(SleepFunction fn) { sleep_function = std::move(fn); }

    // Finds, serves and rebinds the tablet until running drops.
    void run();

    // One bind/stream/teardown cycle on an already found device.
    SessionEnd serve_device(UsbDevice& dev);

    uint64_t get_session_samples() const { return session_samples; }
    uint64_t get_total_samples() const { return total_samples; }
    int get_session_count() const { return session_count; }

private:
    UsbBus& bus;
    const TabletBinder& binder;
    SinkFactory sink_factory;
    LoopOptions options;
    std::atomic<bool>& running;
    SleepFunction sleep_function;

    uint64_t session_samples = 0;
    uint64_t total_samples = 0;
    int session_count = 0;

    SessionEnd pump(UsbDevice& dev, SinkRegistry& sinks);
    void sleep_ms(int milliseconds);
};

#endif // ACQUISITION_LOOP_HPP

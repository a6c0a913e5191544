#include "acquisition_loop.hpp"
#include "stylus_report.hpp"
#include "log.hpp"

#include <libusb-1.0/libusb.h>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <thread>
#include <vector>

namespace {

// Runs its step once when the scope closes. Steps declared in acquisition
// order therefore run in reverse order on every exit path.
class ScopedStep {
public:
    explicit ScopedStep(std::function<void()> step) : step(std::move(step)) {}
    ~ScopedStep() {
        if (step) {
            step();
        }
    }

    ScopedStep(const ScopedStep&) = delete;
    ScopedStep& operator=(const ScopedStep&) = delete;

private:
    std::function<void()> step;
};

constexpr int SLEEP_SLICE_MS = 100;

} // namespace

const char* session_end_name(SessionEnd end) {
    switch (end) {
        case SessionEnd::Stopped: return "stopped";
        case SessionEnd::BindFailed: return "bind failed";
        case SessionEnd::SinkSetupFailed: return "sink setup failed";
        case SessionEnd::NoSinks: return "no sinks";
        case SessionEnd::TransportError: return "transport error";
        case SessionEnd::SinkFailure: return "sink failure";
    }
    return "unknown";
}

bool is_transient_read_error(int rc) {
    return rc == LIBUSB_ERROR_TIMEOUT || rc == LIBUSB_ERROR_INTERRUPTED;
}

AcquisitionLoop::AcquisitionLoop(UsbBus& bus, const TabletBinder& binder, SinkFactory sink_factory,
                                 LoopOptions options, std::atomic<bool>& running)
    : bus(bus), binder(binder), sink_factory(std::move(sink_factory)),
      options(std::move(options)), running(running) {
}

void AcquisitionLoop::sleep_ms(int milliseconds) {
    if (sleep_function) {
        sleep_function(milliseconds);
        return;
    }

    // Sliced so a stop request is seen promptly
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(milliseconds);
    while (running) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(SLEEP_SLICE_MS)));
    }
}

void AcquisitionLoop::run() {
    while (running) {
        auto dev = binder.find(bus, options.selector);
        if (!dev) {
            if (options.selector) {
                log_error() << "Device " << format_ugen(*options.selector) << " not present; sleeping "
                            << std::fixed << std::setprecision(1) << options.scan_interval_ms / 1000.0 << "s";
            } else {
                log_debug() << "Tablet not found; rescanning in "
                            << std::fixed << std::setprecision(1) << options.scan_interval_ms / 1000.0 << "s";
            }
            sleep_ms(options.scan_interval_ms);
            continue;
        }

        SessionEnd end = serve_device(*dev);
        log_info() << "Session ended (" << session_end_name(end) << "), "
                   << session_samples << " samples forwarded";
        dev.reset();

        if (running) {
            sleep_ms(options.restart_delay_ms);
        }
    }
}

SessionEnd AcquisitionLoop::serve_device(UsbDevice& dev) {
    BusAddress where = dev.location();
    log_info() << "Binding to tablet (bus=" << where.bus << " addr=" << where.address << ")";

    session_count++;
    session_samples = 0;

    bool detached = false;
    SinkRegistry sinks;

    ScopedStep reset_step([&] {
        if (!options.skip_set_alt) {
            binder.force_reset(dev, options.interface);
        }
    });
    ScopedStep reattach_step([&] {
        if (detached) {
            binder.attach_kernel_driver(dev, options.interface);
        }
    });
    ScopedStep release_step([&] { binder.release(dev, options.interface); });
    ScopedStep close_step([&] { sinks.close_all(); });

    int rc = binder.unlock(dev, options.verbose);
    if (rc < 0) {
        log_warning() << "USB error while unlocking (" << libusb_error_name(rc) << "); will rescan";
        return SessionEnd::BindFailed;
    }

    if (options.force_detach) {
        rc = binder.detach_kernel_driver(dev, options.interface);
        if (rc < 0) {
            return SessionEnd::BindFailed;
        }
        detached = rc == 1;
    }

    rc = binder.claim(dev, options.interface);
    if (rc < 0) {
        return SessionEnd::BindFailed;
    }

    if (!sink_factory(sinks)) {
        log_error() << "Could not set up output targets; aborting session";
        return SessionEnd::SinkSetupFailed;
    }
    if (sinks.empty()) {
        log_error() << "No output targets requested. Aborting.";
        return SessionEnd::NoSinks;
    }

    return pump(dev, sinks);
}

SessionEnd AcquisitionLoop::pump(UsbDevice& dev, SinkRegistry& sinks) {
    std::vector<unsigned char> buffer(static_cast<size_t>(options.read_size));

    while (running) {
        int transferred = 0;
        int rc = dev.interrupt_read(options.endpoint, buffer.data(), options.read_size,
                                    &transferred, options.read_timeout_ms);
        if (rc < 0 && !is_transient_read_error(rc)) {
            log_warning() << "USB error while streaming (" << libusb_error_name(rc) << "); will rescan";
            return SessionEnd::TransportError;
        }
        // A timed out transfer may still carry a complete report
        if (transferred <= 0) {
            continue;
        }

        auto sample = decode_stylus_report(buffer.data(), static_cast<size_t>(transferred));
        if (!sample) {
            continue;
        }

        if (!sinks.forward_all(*sample)) {
            return SessionEnd::SinkFailure;
        }
        session_samples++;
        total_samples++;
    }
    return SessionEnd::Stopped;
}

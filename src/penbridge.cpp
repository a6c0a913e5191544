#include "../version.hpp"
#include "acquisition_loop.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "diagnostics.hpp"
#include "libusb_bus.hpp"
#include "log.hpp"
#include "socket_sink.hpp"
#include "tablet_binder.hpp"
#include "tablet_constants.hpp"
#include "uinput_control.hpp"
#include "uinput_sink.hpp"

#include <signal.h>
#include <atomic>
#include <cmath>
#include <cstring>
#include <iostream>

static std::atomic<bool> running(true);
static volatile sig_atomic_t stop_signal = 0;

void signal_handler(int sig) {
    stop_signal = sig;
    running = false;
}

static void install_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Socket writes report EPIPE instead
    signal(SIGPIPE, SIG_IGN);
}

static LoopOptions loop_options_from(const Config& config) {
    LoopOptions options;
    if (!config.device.empty()) {
        options.selector = parse_ugen(config.device);
    }
    options.read_timeout_ms = static_cast<unsigned int>(config.timeout_ms);
    options.scan_interval_ms = static_cast<int>(std::lround(config.scan_interval * 1000.0));
    options.restart_delay_ms = config.restart_delay_ms;
    options.force_detach = config.force_detach;
    options.skip_set_alt = config.skip_set_alt;
    options.verbose = config.verbose;
    return options;
}

static SinkFactory make_sink_factory(const Config& config) {
    return [config](SinkRegistry& sinks) {
        if (config.uinput) {
            UinputSinkOptions options;
            options.uinput_path = config.uinput_path;
            options.input_dir = INPUT_DEVICE_DIR;
            options.device_name = config.uinput_name;
            options.vendor = config.vendor_id;
            options.product = config.product_id;
            options.event_mode = static_cast<mode_t>(config.event_mode);
            options.event_group = config.event_group;
            options.verify_node = config.verbose;

            auto sink = UinputSink::create(options, std::make_unique<SystemUinputControl>());
            if (!sink) {
                return false;
            }
            sinks.add(std::move(sink));
        }
        if (!config.socket_path.empty()) {
            auto sink = SocketSink::create(config.socket_path);
            if (!sink) {
                return false;
            }
            sinks.add(std::move(sink));
        }
        return true;
    };
}

static int run_bridge(const Config& config) {
    LibusbBus bus;
    if (!bus.initialize()) {
        return 1;
    }

    BinderOptions binder_options = default_binder_options();
    binder_options.vendor_id = config.vendor_id;
    binder_options.product_id = config.product_id;
    TabletBinder binder(binder_options);

    AcquisitionLoop loop(bus, binder, make_sink_factory(config), loop_options_from(config), running);
    loop.run();

    if (stop_signal != 0) {
        log_info() << "Received signal " << static_cast<int>(stop_signal) << ", stopping";
    }
    log_info() << "Stopped after " << loop.get_session_count() << " sessions, "
               << loop.get_total_samples() << " samples";
    return 0;
}

int main(int argc, char* argv[]) {
    log_init("penbridge", LogLevel::Info, false);

    try {
        CliOptions options;
        options.config_path = find_config_override(argc, argv);
        if (auto loaded = ConfigManager::load(options.config_path)) {
            options.config = *loaded;
        }

        std::string error;
        if (!parse_command_line(argc, argv, options, error)) {
            std::cerr << argv[0] << ": " << error << "\n";
            std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
            return 2;
        }

        if (options.show_help) {
            print_usage(argv[0]);
            return 0;
        }
        if (options.show_version) {
            std::cout << "penbridge " << PENBRIDGE_VERSION << "\n";
            return 0;
        }

        Config& config = options.config;
        error = ConfigManager::validate(config);
        if (!error.empty()) {
            std::cerr << argv[0] << ": " << error << "\n";
            return 2;
        }

        if (!options.write_config_path.empty()) {
            if (!ConfigManager::save(options.write_config_path, config)) {
                std::cerr << "Failed to write " << options.write_config_path << "\n";
                return 1;
            }
            std::cout << "Wrote " << options.write_config_path << "\n";
            return 0;
        }

        set_log_level(config.verbose ? LogLevel::Debug : LogLevel::Info);

        if (options.check) {
            LibusbBus bus;
            if (!bus.initialize()) {
                return 1;
            }
            return run_diagnostics(config, bus, std::cout);
        }

        install_signal_handlers();

        if (config.daemonize) {
            if (!daemonize_process()) {
                return 1;
            }
            log_init("penbridge", config.verbose ? LogLevel::Debug : LogLevel::Info, true);
        }

        log_info() << "penbridge " << PENBRIDGE_VERSION << " starting ("
                   << (config.device.empty() ? "scanning" : config.device) << ")";
        int status = run_bridge(config);
        log_shutdown();
        return status;
    } catch (const std::exception& e) {
        log_error() << "Fatal: " << e.what();
        log_shutdown();
        return 1;
    }
}

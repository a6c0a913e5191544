#include "cli_options.hpp"
#include "tablet_constants.hpp"
#include "usb_device.hpp"

#include <cmath>
#include <cstring>
#include <iostream>

namespace {

bool parse_double(const char* text, double& out) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != strlen(text) || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_int(const char* text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != strlen(text)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string find_config_override(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; i++) {
        if (strcmp(argv[i], "--config") == 0) {
            return argv[i + 1];
        }
    }
    return ConfigManager::get_config_path();
}

bool parse_command_line(int argc, char* argv[], CliOptions& options, std::string& error) {
    Config& config = options.config;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        // Flags that take a value
        auto next_value = [&](const char*& value) {
            if (i + 1 >= argc) {
                error = std::string(arg) + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };
        const char* value = nullptr;

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            options.show_help = true;
        } else if (strcmp(arg, "--version") == 0) {
            options.show_version = true;
        } else if (strcmp(arg, "--check") == 0) {
            options.check = true;
        } else if (strcmp(arg, "--scan") == 0) {
            config.scan = true;
            config.device.clear();
        } else if (strcmp(arg, "--daemonize") == 0) {
            config.daemonize = true;
        } else if (strcmp(arg, "--verbose") == 0 || strcmp(arg, "-v") == 0) {
            config.verbose = true;
        } else if (strcmp(arg, "--no-uinput") == 0) {
            config.uinput = false;
        } else if (strcmp(arg, "--force-detach") == 0) {
            config.force_detach = true;
        } else if (strcmp(arg, "--skip-set-alt") == 0) {
            config.skip_set_alt = true;
        } else if (strcmp(arg, "--config") == 0) {
            if (!next_value(value)) return false;
            options.config_path = value;
        } else if (strcmp(arg, "--write-config") == 0) {
            if (!next_value(value)) return false;
            options.write_config_path = value;
        } else if (strcmp(arg, "--device") == 0) {
            if (!next_value(value)) return false;
            if (!parse_ugen(value)) {
                error = std::string("invalid device selector '") + value + "' (expected ugenB.A)";
                return false;
            }
            config.device = value;
            config.scan = false;
        } else if (strcmp(arg, "--scan-interval") == 0) {
            if (!next_value(value)) return false;
            if (!parse_double(value, config.scan_interval) || config.scan_interval <= 0.0 ||
                config.scan_interval > MAX_SCAN_INTERVAL_SECONDS) {
                error = std::string("invalid scan interval '") + value + "'";
                return false;
            }
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!next_value(value)) return false;
            if (!parse_int(value, config.timeout_ms) || config.timeout_ms <= 0) {
                error = std::string("invalid timeout '") + value + "'";
                return false;
            }
        } else if (strcmp(arg, "--socket-path") == 0) {
            if (!next_value(value)) return false;
            config.socket_path = value;
        } else if (strcmp(arg, "--event-mode") == 0) {
            if (!next_value(value)) return false;
            auto mode = ConfigManager::parse_octal_mode(value);
            if (!mode) {
                error = std::string("invalid octal mode '") + value + "'";
                return false;
            }
            config.event_mode = *mode;
        } else if (strcmp(arg, "--event-group") == 0) {
            if (!next_value(value)) return false;
            config.event_group = value;
        } else {
            error = std::string("unknown option '") + arg + "'";
            return false;
        }
    }

    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTION]...\n";
    std::cout << "penbridge - XP-Pen Deco Mini7 V2 stylus to uinput bridge\n\n";
    std::cout << "Options:\n";
    std::cout << "  --device ugenB.A        Serve only the tablet at this bus/address\n";
    std::cout << "  --scan                  Scan for the tablet (default)\n";
    std::cout << "  --scan-interval SEC     Seconds between scans while no tablet is present (default 5.0)\n";
    std::cout << "  --timeout MS            Endpoint read timeout in milliseconds (default 100)\n";
    std::cout << "  --no-uinput             Do not create a virtual input device\n";
    std::cout << "  --socket-path PATH      Also send JSON samples to this UNIX socket\n";
    std::cout << "  --event-mode OCTAL      Mode for the created event node (default 660)\n";
    std::cout << "  --event-group NAME      Group for the created event node (default input)\n";
    std::cout << "  --force-detach          Detach a kernel driver from the stylus interface\n";
    std::cout << "  --skip-set-alt          Do not run the usbconfig interface reset on teardown\n";
    std::cout << "  --daemonize             Detach from the terminal and log to syslog\n";
    std::cout << "  --verbose, -v           Log debug messages and report dumps\n";
    std::cout << "  --config PATH           Read settings from PATH\n";
    std::cout << "  --write-config PATH     Write the effective settings to PATH and exit\n";
    std::cout << "  --check                 Report tablet, uinput and permission state and exit\n";
    std::cout << "  --version               Print the version and exit\n";
    std::cout << "  --help, -h              Show this help message\n\n";
    std::cout << "Settings are read from $PENBRIDGE_CONFIG or ~/.config/penbridge/config.json;\n";
    std::cout << "command-line options override them.\n";
}

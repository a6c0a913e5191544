#include "diagnostics.hpp"
#include "tablet_constants.hpp"

#include <grp.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

std::optional<std::string> find_in_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return program;
        }
        return std::nullopt;
    }

    const char* path_env = getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

int run_diagnostics(const Config& config, UsbBus& bus, std::ostream& out) {
    int failed_required = 0;

    out << "=== penbridge Diagnostics ===\n\n";

    out << "CONFIGURATION:\n";
    out << "  tablet: " << ConfigManager::format_hex_id(config.vendor_id) << ":"
        << ConfigManager::format_hex_id(config.product_id) << "\n";
    out << "  device: " << (config.device.empty() ? "scan" : config.device) << "\n";
    out << "  scan_interval: " << config.scan_interval << "s\n";
    out << "  timeout: " << config.timeout_ms << "ms\n";
    out << "  uinput: " << (config.uinput ? config.uinput_path : "disabled") << "\n";
    out << "  socket: " << (config.socket_path.empty() ? "none" : config.socket_path) << "\n";
    out << "  event_node: mode " << ConfigManager::format_octal_mode(config.event_mode)
        << " group " << (config.event_group.empty() ? "(unchanged)" : config.event_group) << "\n";
    out << "  force_detach: " << (config.force_detach ? "yes" : "no") << "\n";
    out << "  skip_set_alt: " << (config.skip_set_alt ? "yes" : "no") << "\n";

    out << "\nTABLET:\n";
    std::optional<BusAddress> selector;
    if (!config.device.empty()) {
        selector = parse_ugen(config.device);
    }
    auto devices = bus.find_devices(config.vendor_id, config.product_id);
    bool selected_present = false;
    for (const auto& dev : devices) {
        BusAddress where = dev->location();
        bool selected = !selector || *selector == where;
        out << "  " << format_ugen(where) << " (bus=" << where.bus << " addr=" << where.address << ")"
            << (selected ? "" : " [not selected]") << "\n";
        selected_present = selected_present || selected;
    }
    if (devices.empty()) {
        out << "  status: NOT_FOUND\n";
        failed_required++;
    } else if (!selected_present) {
        out << "  status: SELECTED_DEVICE_MISSING\n";
        failed_required++;
    } else {
        out << "  status: DETECTED_OK\n";
    }

    out << "\nUINPUT:\n";
    if (!config.uinput) {
        out << "  status: DISABLED\n";
    } else if (access(config.uinput_path.c_str(), W_OK) == 0) {
        out << "  " << config.uinput_path << ": writable\n";
        out << "  status: OK\n";
    } else {
        out << "  " << config.uinput_path << ": " << strerror(errno) << "\n";
        out << "  status: ACCESS_FAILED\n";
        failed_required++;
    }

    out << "\nEVENT GROUP:\n";
    if (config.event_group.empty()) {
        out << "  status: NOT_CONFIGURED\n";
    } else if (struct group* gr = getgrnam(config.event_group.c_str())) {
        out << "  " << config.event_group << ": gid " << gr->gr_gid << "\n";
        out << "  status: OK\n";
    } else {
        out << "  " << config.event_group << ": no such group\n";
        out << "  status: WARNING (node group will be left unchanged)\n";
    }

    out << "\nRESET UTILITY:\n";
    if (config.skip_set_alt) {
        out << "  status: SKIPPED\n";
    } else if (auto found = find_in_path(USBCONFIG_COMMAND)) {
        out << "  " << USBCONFIG_COMMAND << ": " << *found << "\n";
        out << "  status: OK\n";
    } else {
        out << "  " << USBCONFIG_COMMAND << ": not found in PATH\n";
        out << "  status: WARNING (interface reset on teardown will be skipped)\n";
    }

    if (!config.socket_path.empty()) {
        out << "\nSOCKET:\n";
        struct stat st;
        if (stat(config.socket_path.c_str(), &st) != 0) {
            out << "  " << config.socket_path << ": " << strerror(errno) << "\n";
            out << "  status: MISSING\n";
            failed_required++;
        } else if (!S_ISSOCK(st.st_mode)) {
            out << "  " << config.socket_path << ": not a socket\n";
            out << "  status: NOT_A_SOCKET\n";
            failed_required++;
        } else {
            out << "  status: OK\n";
        }
    }

    out << "\nSUMMARY: " << (failed_required == 0 ? "OK" : "FAILED")
        << " (" << failed_required << " required check" << (failed_required == 1 ? "" : "s")
        << " failed)\n";
    return failed_required == 0 ? 0 : 1;
}

#include "tablet_binder.hpp"
#include "tablet_constants.hpp"
#include "stylus_report.hpp"
#include "log.hpp"

#include <libusb-1.0/libusb.h>
#include <sys/wait.h>
#include <array>
#include <cstdio>

namespace {

constexpr uint8_t HID_REQUEST_TYPE_CLASS_OUT = 0x21;
constexpr uint8_t HID_REQUEST_SET_IDLE = 0x0a;
constexpr uint8_t HID_REQUEST_TYPE_STANDARD_IN = 0x81;
constexpr uint8_t HID_REQUEST_GET_DESCRIPTOR = 0x06;
constexpr uint16_t HID_REPORT_DESCRIPTOR_VALUE = 0x2200;

} // namespace

BinderOptions default_binder_options() {
    BinderOptions options;
    options.vendor_id = TABLET_VENDOR_ID;
    options.product_id = TABLET_PRODUCT_ID;
    options.reset_command = USBCONFIG_COMMAND;
    return options;
}

int run_shell_command(const std::string& command, std::string& output) {
    output.clear();
    std::string full = command + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        return -1;
    }

    std::array<char, 128> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe);
    if (status < 0) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

TabletBinder::TabletBinder(BinderOptions options)
    : options(std::move(options)), command_runner(run_shell_command) {
}

std::unique_ptr<UsbDevice> TabletBinder::find(UsbBus& bus, const std::optional<BusAddress>& selector) const {
    auto devices = bus.find_devices(options.vendor_id, options.product_id);
    for (auto& dev : devices) {
        if (!selector || dev->location() == *selector) {
            return std::move(dev);
        }
    }
    return nullptr;
}

int TabletBinder::unlock(UsbDevice& dev, bool verbose) const {
    int rc = dev.set_configuration();
    if (rc == LIBUSB_ERROR_BUSY) {
        log_debug() << "Device already configured";
    } else if (rc < 0) {
        log_error() << "set_configuration failed: " << libusb_error_name(rc);
        return rc;
    }

    for (const auto& [interface, length] : UNLOCK_REPORT_LENGTHS) {
        log_debug() << "SET_IDLE iface " << interface;
        rc = set_idle(dev, interface);
        if (rc < 0) {
            log_error() << "SET_IDLE on interface " << interface << " failed: " << libusb_error_name(rc);
            return rc;
        }

        log_debug() << "GET_REPORT_DESCRIPTOR iface " << interface << " len=" << length;
        std::vector<unsigned char> descriptor;
        rc = get_report_descriptor(dev, interface, length, descriptor);
        if (rc < 0) {
            log_error() << "GET_REPORT_DESCRIPTOR on interface " << interface
                        << " failed: " << libusb_error_name(rc);
            return rc;
        }
        if (verbose) {
            log_debug() << "    " << hexdump(descriptor.data(), descriptor.size());
        }
    }
    return LIBUSB_SUCCESS;
}

int TabletBinder::set_idle(UsbDevice& dev, int interface) const {
    return dev.control_transfer(HID_REQUEST_TYPE_CLASS_OUT, HID_REQUEST_SET_IDLE, 0,
                                static_cast<uint16_t>(interface), nullptr, 0, CONTROL_TIMEOUT_MS);
}

int TabletBinder::get_report_descriptor(UsbDevice& dev, int interface, uint16_t length,
                                        std::vector<unsigned char>& descriptor) const {
    descriptor.assign(length, 0);
    int rc = dev.control_transfer(HID_REQUEST_TYPE_STANDARD_IN, HID_REQUEST_GET_DESCRIPTOR,
                                  HID_REPORT_DESCRIPTOR_VALUE, static_cast<uint16_t>(interface),
                                  descriptor.data(), length, CONTROL_TIMEOUT_MS);
    if (rc < 0) {
        descriptor.clear();
        return rc;
    }
    descriptor.resize(static_cast<size_t>(rc));
    return rc;
}

int TabletBinder::detach_kernel_driver(UsbDevice& dev, int interface) const {
    int active = dev.kernel_driver_active(interface);
    if (active == LIBUSB_ERROR_NOT_SUPPORTED) {
        log_debug() << "Kernel driver status not available on this platform";
        return 0;
    }
    if (active < 0) {
        log_error() << "Failed to query kernel driver on interface " << interface
                    << ": " << libusb_error_name(active);
        return active;
    }
    if (active == 0) {
        return 0;
    }

    int rc = dev.detach_kernel_driver(interface);
    if (rc < 0) {
        log_error() << "Failed to detach kernel driver: " << libusb_error_name(rc);
        return rc;
    }
    log_info() << "Detached kernel driver from interface " << interface;
    return 1;
}

void TabletBinder::attach_kernel_driver(UsbDevice& dev, int interface) const {
    int rc = dev.attach_kernel_driver(interface);
    if (rc < 0) {
        log_warning() << "Could not reattach kernel driver: " << libusb_error_name(rc);
        return;
    }
    log_info() << "Reattached kernel driver to interface " << interface;
}

int TabletBinder::claim(UsbDevice& dev, int interface) const {
    int rc = dev.claim_interface(interface);
    if (rc < 0) {
        log_error() << "Failed to claim interface " << interface << ": " << libusb_error_name(rc);
    }
    return rc;
}

void TabletBinder::release(UsbDevice& dev, int interface) const {
    int rc = dev.release_interface(interface);
    if (rc == LIBUSB_ERROR_NOT_FOUND) {
        log_debug() << "Interface " << interface << " was not claimed";
    } else if (rc < 0) {
        log_warning() << "Failed to release interface " << interface << ": " << libusb_error_name(rc);
    }
    dev.dispose();
}

std::string TabletBinder::reset_command_line(const BusAddress& where, int interface) const {
    return options.reset_command + " -d " + format_ugen(where) + " -i " + std::to_string(interface) + " set_alt 0";
}

void TabletBinder::force_reset(UsbDevice& dev, int interface) const {
    BusAddress where = dev.location();
    if (where.bus < 0 || where.address < 0) {
        log_warning() << "Device bus/address unknown; cannot run " << options.reset_command << " set_alt";
        return;
    }

    std::string output;
    int status = command_runner(reset_command_line(where, interface), output);
    if (status == 0) {
        log_info() << "Forced " << options.reset_command << " set_alt 0 on " << format_ugen(where)
                   << " interface " << interface;
    } else if (status == 127) {
        log_warning() << options.reset_command << " not found; skipping set_alt recovery";
    } else {
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.pop_back();
        }
        log_warning() << options.reset_command << " failed (status " << status << "): " << output;
    }
}

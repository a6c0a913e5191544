#ifndef TABLET_BINDER_HPP
#define TABLET_BINDER_HPP

#include "usb_device.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct BinderOptions {
    uint16_t vendor_id;
    uint16_t product_id;
    std::string reset_command;
};

BinderOptions default_binder_options();

// Runs a shell command, stores its combined output and returns the exit
// status (127 when the command could not be found, -1 when it never ran).
using CommandRunner = std::function<int(const std::string& command, std::string& output)>;

int run_shell_command(const std::string& command, std::string& output);

class TabletBinder {
public:
    explicit TabletBinder(BinderOptions options);

    void set_command_runner(CommandRunner runner) { command_runner = std::move(runner); }

    // First tablet on the bus, or the one at selector. nullptr when none matches.
    std::unique_ptr<UsbDevice> find(UsbBus& bus, const std::optional<BusAddress>& selector) const;

    // Puts the device in a configured state and sends the SET_IDLE and
    // report descriptor requests the firmware waits for before streaming.
    int unlock(UsbDevice& dev, bool verbose) const;

    // 1 when a driver was detached, 0 when there was nothing to detach.
    int detach_kernel_driver(UsbDevice& dev, int interface) const;
    void attach_kernel_driver(UsbDevice& dev, int interface) const;

    int claim(UsbDevice& dev, int interface) const;
    // Safe to call when the claim never happened; always disposes the handle.
    void release(UsbDevice& dev, int interface) const;

    void force_reset(UsbDevice& dev, int interface) const;
    std::string reset_command_line(const BusAddress& where, int interface) const;

private:
    BinderOptions options;
    CommandRunner command_runner;

    int set_idle(UsbDevice& dev, int interface) const;
    int get_report_descriptor(UsbDevice& dev, int interface, uint16_t length,
                              std::vector<unsigned char>& descriptor) const;
};

#endif // TABLET_BINDER_HPP

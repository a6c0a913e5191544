#ifndef VIRTUAL_DEVICE_HPP
#define VIRTUAL_DEVICE_HPP

#include "stylus_report.hpp"
#include "uinput_control.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <linux/uinput.h>

struct AxisSpec {
    uint16_t code;
    int32_t minimum;
    int32_t maximum;
    int32_t resolution;
};

// X/Y in tablet units at 5080 lpi, 14-bit pressure, +-127 tilt
std::vector<AxisSpec> default_pen_axes();

// Key codes registered on the pen, in registration order.
std::vector<uint16_t> pen_buttons();

// The ten events making up one frame before SYN_REPORT.
std::vector<struct input_event> sample_to_events(const StylusSample& sample);

// Maps a uinput sysname to the event node below input_dir. On Linux the
// sysname is the inputN directory under /sys/devices/virtual/input and the
// node is the eventM entry inside it.
std::string event_node_for_sysname(const std::string& sysname, const std::string& input_dir);

class VirtualDevice {
public:
    VirtualDevice(std::unique_ptr<UinputControl> control, const std::string& device_name,
                  uint16_t vendor, uint16_t product,
                  std::vector<AxisSpec> axes = default_pen_axes());
    ~VirtualDevice();

    VirtualDevice(const VirtualDevice&) = delete;
    VirtualDevice& operator=(const VirtualDevice&) = delete;

    bool initialize(const std::string& uinput_path);
    // Destroys the device if it was created, then closes the descriptor once.
    void cleanup();

    int get_fd() const { return uinput_fd; }
    bool is_ready() const { return ready; }

    bool emit(const StylusSample& sample);
    bool write_event(uint16_t type, uint16_t code, int32_t value);
    bool emit_sync();

    std::optional<std::string> query_node_path(const std::string& input_dir);
    void apply_permissions(const std::string& path, mode_t mode, const std::string& group);

private:
    std::unique_ptr<UinputControl> control;
    std::string device_name;
    uint16_t vendor;
    uint16_t product;
    std::vector<AxisSpec> axes;
    int uinput_fd;
    bool ready;

    bool setup_uinput(const std::string& uinput_path);
    bool enable_event_types();
    bool enable_buttons();
    bool enable_axes();
    bool setup_axis(const AxisSpec& axis);
    bool setup_identity();
    bool create_device();
};

#endif // VIRTUAL_DEVICE_HPP

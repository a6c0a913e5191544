#include "virtual_device.hpp"
#include "log.hpp"

#include <libevdev-1.0/libevdev/libevdev.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>

// The kernel reads these records byte for byte
static_assert(sizeof(struct input_id) == 8, "input_id layout");
static_assert(sizeof(struct input_absinfo) == 24, "input_absinfo layout");
static_assert(offsetof(struct uinput_abs_setup, absinfo) == 4, "uinput_abs_setup layout");
static_assert(sizeof(struct uinput_abs_setup) == 28, "uinput_abs_setup layout");
static_assert(offsetof(struct uinput_setup, name) == sizeof(struct input_id), "uinput_setup layout");
static_assert(sizeof(struct uinput_setup) == sizeof(struct input_id) + UINPUT_MAX_NAME_SIZE + sizeof(uint32_t),
              "uinput_setup layout");
static_assert(offsetof(struct input_event, type) == 2 * sizeof(long), "input_event layout");
static_assert(sizeof(struct input_event) == 2 * sizeof(long) + 8, "input_event layout");

namespace {

const char* abs_name(uint16_t code) {
    const char* name = libevdev_event_code_get_name(EV_ABS, code);
    return name ? name : "UNKNOWN";
}

const char* key_name(uint16_t code) {
    const char* name = libevdev_event_code_get_name(EV_KEY, code);
    return name ? name : "UNKNOWN";
}

struct input_event make_event(uint16_t type, uint16_t code, int32_t value) {
    struct input_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return ev;
}

} // namespace

std::vector<AxisSpec> default_pen_axes() {
    return {
        {ABS_X, 0, 0x4585, 5080},
        {ABS_Y, 0, 0x2b65, 5080},
        {ABS_PRESSURE, 0, 0x3fff, 1},
        {ABS_TILT_X, -127, 127, 1},
        {ABS_TILT_Y, -127, 127, 1},
    };
}

std::vector<uint16_t> pen_buttons() {
    return {BTN_TOUCH, BTN_STYLUS, BTN_STYLUS2, BTN_TOOL_PEN, BTN_TOOL_RUBBER};
}

std::vector<struct input_event> sample_to_events(const StylusSample& sample) {
    return {
        make_event(EV_ABS, ABS_X, sample.x),
        make_event(EV_ABS, ABS_Y, sample.y),
        make_event(EV_ABS, ABS_PRESSURE, sample.pressure),
        make_event(EV_ABS, ABS_TILT_X, sample.tilt_x),
        make_event(EV_ABS, ABS_TILT_Y, sample.tilt_y),
        make_event(EV_KEY, BTN_TOUCH, sample.tip ? 1 : 0),
        make_event(EV_KEY, BTN_STYLUS, sample.barrel ? 1 : 0),
        make_event(EV_KEY, BTN_STYLUS2, sample.eraser ? 1 : 0),
        make_event(EV_KEY, BTN_TOOL_PEN, sample.in_range && !sample.invert ? 1 : 0),
        make_event(EV_KEY, BTN_TOOL_RUBBER, sample.in_range && sample.invert ? 1 : 0),
    };
}

std::string event_node_for_sysname(const std::string& sysname, const std::string& input_dir) {
    const std::string sys_dir = "/sys/devices/virtual/input/" + sysname;
    std::error_code ec;
    if (sysname.rfind("input", 0) == 0 && std::filesystem::is_directory(sys_dir, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(sys_dir, ec)) {
            std::string entry_name = entry.path().filename().string();
            if (entry_name.rfind("event", 0) == 0) {
                return input_dir + "/" + entry_name;
            }
        }
    }
    return input_dir + "/" + sysname;
}

VirtualDevice::VirtualDevice(std::unique_ptr<UinputControl> control, const std::string& device_name,
                             uint16_t vendor, uint16_t product, std::vector<AxisSpec> axes)
    : control(std::move(control)), device_name(device_name), vendor(vendor), product(product),
      axes(std::move(axes)), uinput_fd(-1), ready(false) {
}

VirtualDevice::~VirtualDevice() {
    cleanup();
}

bool VirtualDevice::initialize(const std::string& uinput_path) {
    if (ready) {
        return true;
    }

    if (!setup_uinput(uinput_path)) {
        return false;
    }

    if (!enable_event_types() || !enable_buttons() || !enable_axes()) {
        cleanup();
        return false;
    }

    // Axis calibration has to be in place before UI_DEV_CREATE
    for (const auto& axis : axes) {
        if (!setup_axis(axis)) {
            cleanup();
            return false;
        }
    }

    if (!setup_identity() || !create_device()) {
        cleanup();
        return false;
    }

    ready = true;
    return true;
}

void VirtualDevice::cleanup() {
    if (uinput_fd >= 0) {
        if (ready && control->ioctl_void(uinput_fd, UI_DEV_DESTROY) < 0) {
            log_warning() << "UI_DEV_DESTROY failed: " << strerror(errno);
        }
        if (control->close_node(uinput_fd) < 0) {
            log_warning() << "Closing uinput descriptor failed: " << strerror(errno);
        }
        uinput_fd = -1;
    }
    ready = false;
}

bool VirtualDevice::setup_uinput(const std::string& uinput_path) {
    uinput_fd = control->open_node(uinput_path);
    if (uinput_fd < 0) {
        log_error() << "Failed to open " << uinput_path << ": " << strerror(errno);
        uinput_fd = -1;
        return false;
    }
    return true;
}

bool VirtualDevice::enable_event_types() {
    if (control->ioctl_int(uinput_fd, UI_SET_EVBIT, EV_KEY) < 0 ||
        control->ioctl_int(uinput_fd, UI_SET_EVBIT, EV_ABS) < 0) {
        log_error() << "Failed to enable event types: " << strerror(errno);
        return false;
    }
    return true;
}

bool VirtualDevice::enable_buttons() {
    for (uint16_t btn : pen_buttons()) {
        if (control->ioctl_int(uinput_fd, UI_SET_KEYBIT, btn) < 0) {
            log_error() << "Failed to enable " << key_name(btn) << ": " << strerror(errno);
            return false;
        }
    }
    return true;
}

bool VirtualDevice::enable_axes() {
    for (const auto& axis : axes) {
        if (control->ioctl_int(uinput_fd, UI_SET_ABSBIT, axis.code) < 0) {
            log_error() << "Failed to enable " << abs_name(axis.code) << ": " << strerror(errno);
            return false;
        }
    }
    return true;
}

bool VirtualDevice::setup_axis(const AxisSpec& axis) {
    struct uinput_abs_setup abs_setup;
    memset(&abs_setup, 0, sizeof(abs_setup));
    abs_setup.code = axis.code;
    abs_setup.absinfo.value = axis.minimum;
    abs_setup.absinfo.minimum = axis.minimum;
    abs_setup.absinfo.maximum = axis.maximum;
    abs_setup.absinfo.resolution = axis.resolution;

    if (control->ioctl_ptr(uinput_fd, UI_ABS_SETUP, &abs_setup) < 0) {
        log_error() << "UI_ABS_SETUP failed for " << abs_name(axis.code) << ": " << strerror(errno);
        return false;
    }
    log_debug() << "Axis " << abs_name(axis.code) << " [" << axis.minimum << ", " << axis.maximum
                << "] res " << axis.resolution;
    return true;
}

bool VirtualDevice::setup_identity() {
    struct uinput_setup setup;
    memset(&setup, 0, sizeof(setup));
    setup.id.bustype = BUS_USB;
    setup.id.vendor = vendor;
    setup.id.product = product;
    setup.id.version = 0;

    // Zero filled, so the terminator survives the longest name
    size_t name_length = std::min(device_name.size(), static_cast<size_t>(UINPUT_MAX_NAME_SIZE - 1));
    memcpy(setup.name, device_name.data(), name_length);
    setup.ff_effects_max = 0;

    if (control->ioctl_ptr(uinput_fd, UI_DEV_SETUP, &setup) < 0) {
        log_error() << "UI_DEV_SETUP failed: " << strerror(errno);
        return false;
    }
    return true;
}

bool VirtualDevice::create_device() {
    if (control->ioctl_void(uinput_fd, UI_DEV_CREATE) < 0) {
        log_error() << "Failed to create uinput device: " << strerror(errno);
        return false;
    }
    log_info() << "Created virtual device \"" << device_name << "\"";
    return true;
}

bool VirtualDevice::emit(const StylusSample& sample) {
    for (const auto& ev : sample_to_events(sample)) {
        if (!write_event(ev.type, ev.code, ev.value)) {
            return false;
        }
    }
    return emit_sync();
}

bool VirtualDevice::write_event(uint16_t type, uint16_t code, int32_t value) {
    if (uinput_fd < 0 || !ready) {
        return false;
    }

    struct input_event ev = make_event(type, code, value);
    struct timeval now;
    gettimeofday(&now, nullptr);
    ev.input_event_sec = now.tv_sec;
    ev.input_event_usec = now.tv_usec;

    ssize_t written = control->write_bytes(uinput_fd, &ev, sizeof(ev));
    if (written != static_cast<ssize_t>(sizeof(ev))) {
        log_error() << "uinput write failed: " << (written < 0 ? strerror(errno) : "short write");
        return false;
    }
    return true;
}

bool VirtualDevice::emit_sync() {
    return write_event(EV_SYN, SYN_REPORT, 0);
}

std::optional<std::string> VirtualDevice::query_node_path(const std::string& input_dir) {
    if (uinput_fd < 0 || !ready) {
        return std::nullopt;
    }

    for (size_t length : {32, 64, 128}) {
        std::vector<char> buffer(length, '\0');
        // Returns the copied length on success
        if (control->ioctl_ptr(uinput_fd, UI_GET_SYSNAME(length), buffer.data()) < 0) {
            continue;
        }
        std::string sysname(buffer.data(), strnlen(buffer.data(), length));
        if (!sysname.empty()) {
            return event_node_for_sysname(sysname, input_dir);
        }
    }
    return std::nullopt;
}

void VirtualDevice::apply_permissions(const std::string& path, mode_t mode, const std::string& group) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        log_debug() << "Event node " << path << " not present; leaving permissions";
        return;
    }

    if (chmod(path.c_str(), mode) != 0) {
        log_warning() << "Could not chmod " << path << ": " << strerror(errno);
    }

    if (group.empty()) {
        return;
    }

    struct group* grp = getgrnam(group.c_str());
    if (!grp) {
        log_warning() << "Group " << group << " not found";
        return;
    }
    if (chown(path.c_str(), st.st_uid, grp->gr_gid) != 0) {
        log_warning() << "Could not chown " << path << ": " << strerror(errno);
    }
}

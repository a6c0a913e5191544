#include "event_node_probe.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <unistd.h>

int EventNodeProbe::open_and_init(const std::string& node_path) {
    close_and_free();

    fd = open(node_path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        return -1;
    }

    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        dev = nullptr;
        close(fd);
        fd = -1;
        return rc;
    }

    path = node_path;
    return 0;
}

void EventNodeProbe::close_and_free() {
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
    path.clear();
}

std::string EventNodeProbe::name() const {
    if (!dev) {
        return "";
    }
    const char* device_name = libevdev_get_name(dev);
    return device_name ? device_name : "";
}

bool EventNodeProbe::verify_axes(const std::vector<AxisSpec>& expected) const {
    if (!dev) {
        return false;
    }

    log_info() << "Event node " << path << ": " << name();

    bool all_match = true;
    for (const auto& axis : expected) {
        const char* axis_name = libevdev_event_code_get_name(EV_ABS, axis.code);
        const struct input_absinfo* info = libevdev_get_abs_info(dev, axis.code);
        if (!info) {
            log_warning() << "  " << (axis_name ? axis_name : "UNKNOWN") << " not registered";
            all_match = false;
            continue;
        }

        log_debug() << "  " << (axis_name ? axis_name : "UNKNOWN")
                    << " min=" << info->minimum << " max=" << info->maximum
                    << " res=" << info->resolution;
        if (info->minimum != axis.minimum || info->maximum != axis.maximum ||
            info->resolution != axis.resolution) {
            log_warning() << "  " << (axis_name ? axis_name : "UNKNOWN") << " calibration differs from requested";
            all_match = false;
        }
    }
    return all_match;
}

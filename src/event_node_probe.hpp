#ifndef EVENT_NODE_PROBE_HPP
#define EVENT_NODE_PROBE_HPP

#include "virtual_device.hpp"

#include <string>
#include <vector>
#include <libevdev-1.0/libevdev/libevdev.h>

// Opens a created event node read-only and checks what the kernel
// registered against the axes we asked for.
struct EventNodeProbe {
    std::string path;
    int fd;
    struct libevdev* dev;

    EventNodeProbe() : fd(-1), dev(nullptr) {}
    ~EventNodeProbe() { close_and_free(); }

    EventNodeProbe(const EventNodeProbe&) = delete;
    EventNodeProbe& operator=(const EventNodeProbe&) = delete;

    int open_and_init(const std::string& node_path);
    void close_and_free();

    std::string name() const;
    // Logs name and ranges; returns false when an axis is missing or its range differs.
    bool verify_axes(const std::vector<AxisSpec>& expected) const;
};

#endif // EVENT_NODE_PROBE_HPP

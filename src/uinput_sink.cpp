#include "uinput_sink.hpp"
#include "event_node_probe.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>

UinputSink::UinputSink(std::unique_ptr<VirtualDevice> device) : device(std::move(device)) {
}

UinputSink::~UinputSink() {
    close();
}

std::unique_ptr<UinputSink> UinputSink::create(const UinputSinkOptions& options,
                                               std::unique_ptr<UinputControl> control) {
    auto device = std::make_unique<VirtualDevice>(std::move(control), options.device_name,
                                                  options.vendor, options.product);
    if (!device->initialize(options.uinput_path)) {
        return nullptr;
    }

    auto sink = std::make_unique<UinputSink>(std::move(device));

    auto node_path = sink->device->query_node_path(options.input_dir);
    if (!node_path) {
        log_info() << "Event node name not available; skipping permission setup";
        return sink;
    }

    sink->event_path = *node_path;
    log_info() << "Virtual device node " << sink->event_path;
    sink->device->apply_permissions(sink->event_path, options.event_mode, options.event_group);

    if (options.verify_node) {
        EventNodeProbe probe;
        int rc = probe.open_and_init(sink->event_path);
        if (rc < 0) {
            log_warning() << "Could not open " << sink->event_path << " for verification: "
                          << strerror(rc == -1 ? errno : -rc);
        } else {
            probe.verify_axes(default_pen_axes());
        }
    }
    return sink;
}

std::string UinputSink::describe() const {
    return event_path.empty() ? "uinput" : "uinput " + event_path;
}

bool UinputSink::forward(const StylusSample& sample) {
    if (!device || !device->is_ready()) {
        return false;
    }
    return device->emit(sample);
}

void UinputSink::close() {
    if (device) {
        device->cleanup();
    }
}

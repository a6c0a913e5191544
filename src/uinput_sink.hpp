#ifndef UINPUT_SINK_HPP
#define UINPUT_SINK_HPP

#include "sample_sink.hpp"
#include "virtual_device.hpp"

#include <memory>
#include <string>
#include <sys/types.h>

struct UinputSinkOptions {
    std::string uinput_path;
    std::string input_dir;
    std::string device_name;
    uint16_t vendor = 0;
    uint16_t product = 0;
    mode_t event_mode = 0;
    std::string event_group;
    bool verify_node = false;
};

class UinputSink : public SampleSink {
public:
    explicit UinputSink(std::unique_ptr<VirtualDevice> device);
    ~UinputSink() override;

    // Creates and configures the virtual device. nullptr when that fails.
    static std::unique_ptr<UinputSink> create(const UinputSinkOptions& options,
                                              std::unique_ptr<UinputControl> control);

    std::string describe() const override;
    bool forward(const StylusSample& sample) override;
    void close() override;

    const std::string& get_event_path() const { return event_path; }

private:
    std::unique_ptr<VirtualDevice> device;
    std::string event_path;
};

#endif // UINPUT_SINK_HPP

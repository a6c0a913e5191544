#ifndef LIBUSB_BUS_HPP
#define LIBUSB_BUS_HPP

#include "usb_device.hpp"

#include <libusb-1.0/libusb.h>

class LibusbDevice : public UsbDevice {
public:
    // Takes its own reference on dev.
    explicit LibusbDevice(libusb_device* dev);
    ~LibusbDevice() override;

    LibusbDevice(const LibusbDevice&) = delete;
    LibusbDevice& operator=(const LibusbDevice&) = delete;

    BusAddress location() const override;

    int set_configuration() override;
    int control_transfer(uint8_t request_type, uint8_t request, uint16_t value,
                         uint16_t index, unsigned char* data, uint16_t length,
                         unsigned int timeout_ms) override;

    int kernel_driver_active(int interface) override;
    int detach_kernel_driver(int interface) override;
    int attach_kernel_driver(int interface) override;

    int claim_interface(int interface) override;
    int release_interface(int interface) override;

    int interrupt_read(unsigned char endpoint, unsigned char* data, int length,
                       int* transferred, unsigned int timeout_ms) override;

    void dispose() override;

private:
    libusb_device* device;
    libusb_device_handle* handle;

    int ensure_open();
};

class LibusbBus : public UsbBus {
public:
    LibusbBus();
    ~LibusbBus() override;

    LibusbBus(const LibusbBus&) = delete;
    LibusbBus& operator=(const LibusbBus&) = delete;

    bool initialize();
    void cleanup();
    bool is_ready() const { return context != nullptr; }

    std::vector<std::unique_ptr<UsbDevice>> find_devices(uint16_t vendor, uint16_t product) override;

private:
    libusb_context* context;
};

#endif // LIBUSB_BUS_HPP

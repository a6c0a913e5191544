#ifndef USB_DEVICE_HPP
#define USB_DEVICE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Status codes follow libusb: 0 or a byte count on success, LIBUSB_ERROR_* otherwise.

struct BusAddress {
    int bus;
    int address;

    bool operator==(const BusAddress& other) const {
        return bus == other.bus && address == other.address;
    }
};

// "ugenB.A" -> {B, A}
std::optional<BusAddress> parse_ugen(const std::string& ugen);
std::string format_ugen(const BusAddress& where);

class UsbDevice {
public:
    virtual ~UsbDevice() = default;

    virtual BusAddress location() const = 0;

    virtual int set_configuration() = 0;
    virtual int control_transfer(uint8_t request_type, uint8_t request, uint16_t value,
                                 uint16_t index, unsigned char* data, uint16_t length,
                                 unsigned int timeout_ms) = 0;

    // 1 attached, 0 not attached, LIBUSB_ERROR_NOT_SUPPORTED where the platform cannot tell
    virtual int kernel_driver_active(int interface) = 0;
    virtual int detach_kernel_driver(int interface) = 0;
    virtual int attach_kernel_driver(int interface) = 0;

    virtual int claim_interface(int interface) = 0;
    virtual int release_interface(int interface) = 0;

    virtual int interrupt_read(unsigned char endpoint, unsigned char* data, int length,
                               int* transferred, unsigned int timeout_ms) = 0;

    // Drops the open handle. Later calls reopen it on demand.
    virtual void dispose() = 0;
};

class UsbBus {
public:
    virtual ~UsbBus() = default;

    // All attached devices with this vendor/product, in enumeration order.
    virtual std::vector<std::unique_ptr<UsbDevice>> find_devices(uint16_t vendor, uint16_t product) = 0;
};

#endif // USB_DEVICE_HPP

#include "libusb_bus.hpp"
#include "log.hpp"

LibusbDevice::LibusbDevice(libusb_device* dev)
    : device(libusb_ref_device(dev)), handle(nullptr) {
}

LibusbDevice::~LibusbDevice() {
    dispose();
    libusb_unref_device(device);
}

BusAddress LibusbDevice::location() const {
    return BusAddress{libusb_get_bus_number(device), libusb_get_device_address(device)};
}

int LibusbDevice::ensure_open() {
    if (handle) {
        return LIBUSB_SUCCESS;
    }
    int rc = libusb_open(device, &handle);
    if (rc < 0) {
        handle = nullptr;
    }
    return rc;
}

int LibusbDevice::set_configuration() {
    int rc = ensure_open();
    if (rc < 0) return rc;

    // No explicit value means the first configuration, as the tablet only has one
    struct libusb_config_descriptor* config = nullptr;
    rc = libusb_get_config_descriptor(device, 0, &config);
    if (rc < 0) return rc;
    int value = config->bConfigurationValue;
    libusb_free_config_descriptor(config);

    int current = 0;
    if (libusb_get_configuration(handle, &current) == LIBUSB_SUCCESS && current == value) {
        return LIBUSB_ERROR_BUSY;
    }
    return libusb_set_configuration(handle, value);
}

int LibusbDevice::control_transfer(uint8_t request_type, uint8_t request, uint16_t value,
                                   uint16_t index, unsigned char* data, uint16_t length,
                                   unsigned int timeout_ms) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_control_transfer(handle, request_type, request, value, index, data, length, timeout_ms);
}

int LibusbDevice::kernel_driver_active(int interface) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_kernel_driver_active(handle, interface);
}

int LibusbDevice::detach_kernel_driver(int interface) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_detach_kernel_driver(handle, interface);
}

int LibusbDevice::attach_kernel_driver(int interface) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_attach_kernel_driver(handle, interface);
}

int LibusbDevice::claim_interface(int interface) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_claim_interface(handle, interface);
}

int LibusbDevice::release_interface(int interface) {
    if (!handle) {
        return LIBUSB_ERROR_NOT_FOUND;
    }
    return libusb_release_interface(handle, interface);
}

int LibusbDevice::interrupt_read(unsigned char endpoint, unsigned char* data, int length,
                                 int* transferred, unsigned int timeout_ms) {
    int rc = ensure_open();
    if (rc < 0) return rc;
    return libusb_interrupt_transfer(handle, endpoint, data, length, transferred, timeout_ms);
}

void LibusbDevice::dispose() {
    if (handle) {
        libusb_close(handle);
        handle = nullptr;
    }
}

LibusbBus::LibusbBus() : context(nullptr) {
}

LibusbBus::~LibusbBus() {
    cleanup();
}

bool LibusbBus::initialize() {
    if (context) {
        return true;
    }
    int rc = libusb_init(&context);
    if (rc < 0) {
        log_error() << "Failed to initialize libusb: " << libusb_error_name(rc);
        context = nullptr;
        return false;
    }
    return true;
}

void LibusbBus::cleanup() {
    if (context) {
        libusb_exit(context);
        context = nullptr;
    }
}

std::vector<std::unique_ptr<UsbDevice>> LibusbBus::find_devices(uint16_t vendor, uint16_t product) {
    std::vector<std::unique_ptr<UsbDevice>> matches;
    if (!context) {
        return matches;
    }

    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(context, &list);
    if (count < 0) {
        log_warning() << "USB enumeration failed: " << libusb_error_name(static_cast<int>(count));
        return matches;
    }

    for (ssize_t i = 0; i < count; i++) {
        struct libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) < 0) {
            continue;
        }
        if (desc.idVendor == vendor && desc.idProduct == product) {
            matches.push_back(std::make_unique<LibusbDevice>(list[i]));
        }
    }

    libusb_free_device_list(list, 1);
    return matches;
}

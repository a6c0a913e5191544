#ifndef UINPUT_CONTROL_HPP
#define UINPUT_CONTROL_HPP

#include <string>
#include <sys/types.h>

// The raw calls a virtual device makes against the uinput node. Return
// values and errno follow the system calls they wrap.
class UinputControl {
public:
    virtual ~UinputControl() = default;

    virtual int open_node(const std::string& path) = 0;
    virtual int ioctl_void(int fd, unsigned long request) = 0;
    virtual int ioctl_int(int fd, unsigned long request, int value) = 0;
    virtual int ioctl_ptr(int fd, unsigned long request, void* arg) = 0;
    virtual ssize_t write_bytes(int fd, const void* data, size_t length) = 0;
    virtual int close_node(int fd) = 0;
};

class SystemUinputControl : public UinputControl {
public:
    int open_node(const std::string& path) override;
    int ioctl_void(int fd, unsigned long request) override;
    int ioctl_int(int fd, unsigned long request, int value) override;
    int ioctl_ptr(int fd, unsigned long request, void* arg) override;
    ssize_t write_bytes(int fd, const void* data, size_t length) override;
    int close_node(int fd) override;
};

#endif // UINPUT_CONTROL_HPP

#include "uinput_control.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <sys/ioctl.h>

int SystemUinputControl::open_node(const std::string& path) {
    return open(path.c_str(), O_WRONLY | O_CLOEXEC);
}

int SystemUinputControl::ioctl_void(int fd, unsigned long request) {
    return ioctl(fd, request);
}

int SystemUinputControl::ioctl_int(int fd, unsigned long request, int value) {
    return ioctl(fd, request, value);
}

int SystemUinputControl::ioctl_ptr(int fd, unsigned long request, void* arg) {
    return ioctl(fd, request, arg);
}

ssize_t SystemUinputControl::write_bytes(int fd, const void* data, size_t length) {
    ssize_t rc;
    do {
        rc = write(fd, data, length);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

int SystemUinputControl::close_node(int fd) {
    return close(fd);
}

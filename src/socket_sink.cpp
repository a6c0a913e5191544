#include "socket_sink.hpp"
#include "log.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

SocketSink::SocketSink(const std::string& socket_path) : socket_path(socket_path), socket_fd(-1) {
}

SocketSink::~SocketSink() {
    close();
}

std::unique_ptr<SocketSink> SocketSink::create(const std::string& socket_path) {
    auto sink = std::make_unique<SocketSink>(socket_path);
    if (!sink->connect_socket()) {
        return nullptr;
    }
    return sink;
}

bool SocketSink::connect_socket() {
    close();

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        log_error() << "Socket path too long: " << socket_path;
        return false;
    }
    strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        log_error() << "Failed to create socket: " << strerror(errno);
        return false;
    }

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error() << "Could not connect to " << socket_path << ": " << strerror(errno);
        ::close(fd);
        return false;
    }

    socket_fd = fd;
    log_info() << "Forwarding samples to " << socket_path;
    return true;
}

std::string SocketSink::describe() const {
    return "socket " + socket_path;
}

bool SocketSink::forward(const StylusSample& sample) {
    if (socket_fd < 0) {
        return true;
    }

    if (!send_all(sample_to_json(sample) + "\n")) {
        int err = errno;
        log_error() << "Socket send failed: " << strerror(err);
        close();
    }
    return true;
}

bool SocketSink::send_all(const std::string& payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t rc = send(socket_fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(rc);
    }
    return true;
}

void SocketSink::close() {
    if (socket_fd >= 0) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}

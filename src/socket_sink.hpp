#ifndef SOCKET_SINK_HPP
#define SOCKET_SINK_HPP

#include "sample_sink.hpp"

#include <memory>
#include <string>

// Streams one JSON line per sample to a listening AF_UNIX stream socket.
// A failed write closes the connection; later samples are dropped.
class SocketSink : public SampleSink {
public:
    explicit SocketSink(const std::string& socket_path);
    ~SocketSink() override;

    SocketSink(const SocketSink&) = delete;
    SocketSink& operator=(const SocketSink&) = delete;

    // Connects once. nullptr when nobody listens at socket_path.
    static std::unique_ptr<SocketSink> create(const std::string& socket_path);

    bool connect_socket();
    bool is_alive() const { return socket_fd >= 0; }

    std::string describe() const override;
    bool forward(const StylusSample& sample) override;
    void close() override;

private:
    std::string socket_path;
    int socket_fd;

    bool send_all(const std::string& payload);
};

#endif // SOCKET_SINK_HPP

#ifndef FRAMELINK_SOCKET_HPP
#define FRAMELINK_SOCKET_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace framelink {

// Owns a connected, blocking stream socket.
// One reader and one writer may use it concurrently; close() may be called from any thread.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd);
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Connected AF_UNIX stream pair. Throws std::system_error.
    static std::pair<Socket, Socket> pair();
    // TCP connect with TCP_NODELAY. Throws ProtocolError(ConnectionError).
    static Socket connect_to(const std::string& host, int port);

    int fd() const { return fd_.load(); }
    bool is_open() const { return fd_.load() >= 0; }

    // Zero means no timeout.
    std::chrono::milliseconds read_timeout() const;
    void set_read_timeout(std::chrono::milliseconds timeout);
    bool try_set_read_timeout(std::chrono::milliseconds timeout) noexcept;
    std::chrono::milliseconds write_timeout() const;
    void set_write_timeout(std::chrono::milliseconds timeout);

    // Returns 0 on orderly shutdown by the peer.
    size_t recv_some(void* buf, size_t len);
    void send_all(const void* buf, size_t len);

    void close() noexcept;

private:
    std::atomic<int> fd_{-1};
};

// Overrides the read timeout for one scope and puts the previous value back on every exit path.
class ScopedReadTimeout {
public:
    ScopedReadTimeout(Socket& sock, std::chrono::milliseconds timeout);
    ~ScopedReadTimeout();

    ScopedReadTimeout(const ScopedReadTimeout&) = delete;
    ScopedReadTimeout& operator=(const ScopedReadTimeout&) = delete;

    std::chrono::milliseconds saved() const { return saved_; }

private:
    Socket& sock_;
    std::chrono::milliseconds saved_;
};

} // namespace framelink

#endif // FRAMELINK_SOCKET_HPP

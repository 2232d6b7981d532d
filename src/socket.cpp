#include "socket.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>

namespace framelink {

namespace {
    timeval to_timeval(std::chrono::milliseconds ms) {
        timeval tv{};
        if (ms.count() > 0) {
            tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
        }
        return tv;
    }

    std::chrono::milliseconds from_timeval(const timeval& tv) {
        return std::chrono::milliseconds(static_cast<long long>(tv.tv_sec) * 1000 + tv.tv_usec / 1000);
    }

    ProtocolError error_from_errno(int err, const char* op) {
        std::error_code cause(err, std::system_category());
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return ProtocolError(ErrorKind::Timeout, std::string(op) + " timed out", cause);
        }
        return ProtocolError(ErrorKind::ConnectionError, std::string(op) + " failed: " + error_to_string(err), cause);
    }

    ProtocolError closed_error(const char* op) {
        return ProtocolError(ErrorKind::ConnectionError, std::string(op) + " on closed socket",
                             std::make_error_code(std::errc::bad_file_descriptor));
    }

    std::chrono::milliseconds get_timeout(int fd, int option) {
        if (fd < 0) {
            throw closed_error("getsockopt");
        }
        timeval tv{};
        socklen_t len = sizeof(tv);
        if (::getsockopt(fd, SOL_SOCKET, option, &tv, &len) < 0) {
            throw error_from_errno(errno, "getsockopt");
        }
        return from_timeval(tv);
    }

    bool set_timeout(int fd, int option, std::chrono::milliseconds timeout) {
        if (fd < 0) {
            errno = EBADF;
            return false;
        }
        timeval tv = to_timeval(timeout);
        return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
    }
}

Socket::Socket(int fd) : fd_(fd) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_.exchange(-1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_.store(other.fd_.exchange(-1));
    }
    return *this;
}

std::pair<Socket, Socket> Socket::pair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        throw std::system_error(errno, std::system_category(), "socketpair");
    }
    return std::make_pair(Socket(fds[0]), Socket(fds[1]));
}

Socket Socket::connect_to(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        throw ProtocolError(ErrorKind::ConnectionError,
                            "getaddrinfo failed for " + host + ": " + ::gai_strerror(gai));
    }

    int last_err = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int s = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (s < 0) {
            last_err = errno;
            continue;
        }
        if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            ::freeaddrinfo(res);
            int one = 1;
            if (::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
                LOG_WARN("setsockopt(TCP_NODELAY) failed: %s", error_to_string(errno).c_str());
            }
            return Socket(s);
        }
        last_err = errno;
        ::close(s);
    }
    ::freeaddrinfo(res);

    throw ProtocolError(ErrorKind::ConnectionError,
                        "connect() to " + host + ":" + service + " failed: " + error_to_string(last_err),
                        std::error_code(last_err, std::system_category()));
}

std::chrono::milliseconds Socket::read_timeout() const {
    return get_timeout(fd_.load(), SO_RCVTIMEO);
}

void Socket::set_read_timeout(std::chrono::milliseconds timeout) {
    if (!set_timeout(fd_.load(), SO_RCVTIMEO, timeout)) {
        throw error_from_errno(errno, "setsockopt(SO_RCVTIMEO)");
    }
}

bool Socket::try_set_read_timeout(std::chrono::milliseconds timeout) noexcept {
    return set_timeout(fd_.load(), SO_RCVTIMEO, timeout);
}

std::chrono::milliseconds Socket::write_timeout() const {
    return get_timeout(fd_.load(), SO_SNDTIMEO);
}

void Socket::set_write_timeout(std::chrono::milliseconds timeout) {
    if (!set_timeout(fd_.load(), SO_SNDTIMEO, timeout)) {
        throw error_from_errno(errno, "setsockopt(SO_SNDTIMEO)");
    }
}

size_t Socket::recv_some(void* buf, size_t len) {
    for (;;) {
        const int fd = fd_.load();
        if (fd < 0) {
            throw closed_error("recv");
        }
        ssize_t r = ::recv(fd, buf, len, 0);
        if (r >= 0) {
            return static_cast<size_t>(r);
        }
        if (errno == EINTR) {
            continue;
        }
        throw error_from_errno(errno, "recv");
    }
}

void Socket::send_all(const void* buf, size_t len) {
    const unsigned char* p = static_cast<const unsigned char*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        const int fd = fd_.load();
        if (fd < 0) {
            throw closed_error("send");
        }
        ssize_t ret = ::send(fd, p, remaining, MSG_NOSIGNAL);
        if (ret > 0) {
            p += ret;
            remaining -= static_cast<size_t>(ret);
        } else if (ret == 0) {
            throw ProtocolError(ErrorKind::ConnectionError, "send wrote 0 bytes");
        } else if (errno != EINTR) {
            throw error_from_errno(errno, "send");
        }
    }
}

void Socket::close() noexcept {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a recv() blocked in another thread; close() alone does not.
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

ScopedReadTimeout::ScopedReadTimeout(Socket& sock, std::chrono::milliseconds timeout)
    : sock_(sock), saved_(sock.read_timeout()) {
    sock_.set_read_timeout(timeout);
}

ScopedReadTimeout::~ScopedReadTimeout() {
    if (!sock_.is_open()) {
        return;
    }
    if (!sock_.try_set_read_timeout(saved_)) {
        LOG_WARN("failed to restore read timeout on fd %d: %s", sock_.fd(), error_to_string(errno).c_str());
    }
}

} // namespace framelink

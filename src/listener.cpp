#include "listener.hpp"
#include "utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace framelink {

Listener::Listener(std::string bind_host, int port) : bind_host_(std::move(bind_host)), port_(port) {}

Listener::~Listener() {
    if (listen_fd_ != -1) {
        close(listen_fd_);
    }
}

bool Listener::start() {
    struct sockaddr_in serv_addr;

    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        LOG_ERROR("socket() failed: %s", error_to_string(errno).c_str());
        return false;
    }

    int opt = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_ERROR("setsockopt() failed: %s", error_to_string(errno).c_str());
        return false;
    }

    memset(&serv_addr, 0, sizeof(serv_addr));
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (bind_host_.empty() || bind_host_ == "0.0.0.0") {
        serv_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (bind_host_ == "localhost") {
        serv_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, bind_host_.c_str(), &serv_addr.sin_addr) != 1) {
        LOG_ERROR("inet_pton failed for %s", bind_host_.c_str());
        return false;
    }

    if (bind(listen_fd_, (struct sockaddr*)&serv_addr, sizeof(serv_addr)) < 0) {
        LOG_ERROR("bind() failed: %s", error_to_string(errno).c_str());
        return false;
    }

    if (listen(listen_fd_, 5) < 0) {
        LOG_ERROR("listen() failed: %s", error_to_string(errno).c_str());
        return false;
    }

    socklen_t len = sizeof(serv_addr);
    if (getsockname(listen_fd_, (struct sockaddr*)&serv_addr, &len) == 0) {
        port_ = ntohs(serv_addr.sin_port);
    }

    LOG_INFO("listening on %s:%d", bind_host_.empty() ? "0.0.0.0" : bind_host_.c_str(), port_);
    return true;
}

Socket Listener::accept_connection(std::chrono::milliseconds wait) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ready <= 0) {
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR("poll() failed: %s", error_to_string(errno).c_str());
        }
        return Socket();
    }

    struct sockaddr_in cli_addr;
    socklen_t clilen = sizeof(cli_addr);
    int new_fd = accept4(listen_fd_, (struct sockaddr*)&cli_addr, &clilen, SOCK_CLOEXEC);
    if (new_fd < 0) {
        LOG_ERROR("accept() failed: %s", error_to_string(errno).c_str());
        return Socket();
    }

    int one = 1;
    if (setsockopt(new_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
        LOG_WARN("setsockopt(TCP_NODELAY) failed: %s", error_to_string(errno).c_str());
    }

    char addr[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &cli_addr.sin_addr, addr, sizeof(addr));
    LOG_INFO("accepted connection from %s:%d", addr, ntohs(cli_addr.sin_port));
    return Socket(new_fd);
}

}

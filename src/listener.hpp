#ifndef LISTENER_HPP
#define LISTENER_HPP

#include "socket.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace framelink {

class Listener {
public:
    // Port 0 picks an ephemeral port; see port() after start().
    Listener(std::string bind_host, int port);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    bool start();
    // Returns a closed Socket if nothing arrived within `wait` or accept() failed.
    Socket accept_connection(std::chrono::milliseconds wait);
    int port() const { return port_; }

private:
    std::string bind_host_;
    int port_;
    int listen_fd_ = -1;
};

}

#endif // LISTENER_HPP

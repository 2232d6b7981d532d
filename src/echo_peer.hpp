#pragma once

#include "app_config.hpp"
#include "envelope.hpp"
#include "listener.hpp"
#include "socket.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace framelink {

// Diagnostic peer for checking the wire contract against a live endpoint.
// The server side answers every envelope with {"status": "OK", "echo": <payload>} under the same type.
class EchoPeer {
public:
    using StopPredicate = std::function<bool()>;

    explicit EchoPeer(const AppConfig& config);

    bool start_listening();
    int listening_port() const;
    // Accepts and serves connections one at a time until should_stop() is true.
    void serve(const StopPredicate& should_stop);
    // Serves one connection until end of stream, a fatal error or should_stop(). Returns replies sent.
    size_t serve_connection(Socket& sock, const StopPredicate& should_stop);

    // Connects, sends one envelope and waits for the reply. Throws ProtocolError.
    std::optional<Envelope> request(const Envelope& envelope);
    std::optional<Envelope> request(Socket& sock, const Envelope& envelope);

private:
    AppConfig config;
    std::unique_ptr<Listener> listener;
};

} // namespace framelink

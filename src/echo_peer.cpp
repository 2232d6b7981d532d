#include "echo_peer.hpp"
#include "errors.hpp"
#include "framing.hpp"
#include "message_types.hpp"
#include "utils.hpp"

namespace framelink {

namespace {
    constexpr std::chrono::milliseconds kAcceptPoll{1000};
}

EchoPeer::EchoPeer(const AppConfig& config) : config(config) {}

bool EchoPeer::start_listening() {
    listener = std::make_unique<Listener>(config.host, config.port);
    return listener->start();
}

int EchoPeer::listening_port() const {
    return listener ? listener->port() : -1;
}

void EchoPeer::serve(const StopPredicate& should_stop) {
    while (!should_stop()) {
        Socket sock = listener->accept_connection(kAcceptPoll);
        if (!sock.is_open()) {
            continue;
        }
        size_t replies = serve_connection(sock, should_stop);
        LOG_INFO("connection finished after %zu replies", replies);
    }
}

size_t EchoPeer::serve_connection(Socket& sock, const StopPredicate& should_stop) {
    size_t replies = 0;
    while (!should_stop()) {
        try {
            auto msg = read_message(sock, config.limits);
            if (!msg) {
                LOG_INFO("client disconnected");
                break;
            }
            json reply = {
                {"status", status::kOk},
                {"echo", msg->payload()}
            };
            write_message(sock, Envelope(msg->type(), std::move(reply)), config.limits);
            ++replies;
        } catch (const ProtocolError& e) {
            if (e.kind() == ErrorKind::Timeout) {
                // idle between frames
                continue;
            }
            if (e.kind() == ErrorKind::MalformedPayload && sock.is_open()) {
                json reply = {
                    {"status", status::kError},
                    {"message", e.what()}
                };
                try {
                    write_message(sock, Envelope(msg::kServerMessage, std::move(reply)),
                                             config.limits);
                    continue;
                } catch (const ProtocolError& send_error) {
                    LOG_WARN("could not report malformed payload: %s", send_error.what());
                }
            }
            break;
        }
    }
    sock.close();
    return replies;
}

std::optional<Envelope> EchoPeer::request(const Envelope& envelope) {
    Socket sock = Socket::connect_to(config.host, config.port);
    return request(sock, envelope);
}

std::optional<Envelope> EchoPeer::request(Socket& sock, const Envelope& envelope) {
    write_message(sock, envelope, config.limits);
    return read_message(sock, config.limits);
}

} // namespace framelink

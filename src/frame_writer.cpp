#include "framing.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <limits>

namespace framelink {

void write_message(Socket& sock, const Envelope& envelope, const ProtocolLimits& limits) {
    const std::string& type = envelope.type();
    try {
        const std::string body = envelope.serialize();
        if (body.size() > limits.max_frame_bytes || body.size() > std::numeric_limits<uint32_t>::max()) {
            throw ProtocolError(ErrorKind::MessageTooLarge,
                                "body of " + std::to_string(body.size()) + " bytes exceeds limit of " +
                                    std::to_string(limits.max_frame_bytes));
        }

        auto frame = build_frame(body);
        sock.send_all(frame.data(), frame.size());
        LOG_DEBUG("sent '%s' (%zu bytes)", type.c_str(), body.size());
    } catch (const ProtocolError& e) {
        switch (e.kind()) {
        case ErrorKind::Timeout:
            LOG_ERROR("Timeout sending message: %s", type.c_str());
            break;
        case ErrorKind::ConnectionError:
            LOG_ERROR("Connection error sending message: %s - %s", type.c_str(), e.what());
            break;
        default:
            LOG_ERROR("Error sending message: %s - %s", type.c_str(), e.what());
            break;
        }
        throw;
    }
}

}

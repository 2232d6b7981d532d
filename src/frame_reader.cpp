#include "framing.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>

namespace framelink {

namespace {
    // Loops until len bytes are in buf. Returns early only if the peer shut the stream down.
    size_t read_upto(Socket& sock, uint8_t* buf, size_t len, size_t chunk) {
        size_t got = 0;
        while (got < len) {
            const size_t want = std::min(len - got, chunk);
            const size_t r = sock.recv_some(buf + got, want);
            if (r == 0) {
                break;
            }
            got += r;
        }
        return got;
    }
}

std::optional<Envelope> read_message(Socket& sock, const ProtocolLimits& limits) {
    try {
        uint8_t hdr[kHeaderBytes] = {0, 0, 0, 0};
        size_t got = 0;
        {
            ScopedReadTimeout guard(sock, limits.header_timeout);
            got = read_upto(sock, hdr, kHeaderBytes, kHeaderBytes);
        }

        if (got == 0) {
            if (!sock.is_open()) {
                throw ProtocolError(ErrorKind::ConnectionError, "socket closed locally while waiting for a frame");
            }
            LOG_DEBUG("peer closed the connection between frames");
            return std::nullopt;
        }
        if (got < kHeaderBytes) {
            throw ProtocolError(ErrorKind::ConnectionError,
                                "connection closed after " + std::to_string(got) + " of 4 header bytes");
        }

        const uint32_t msg_len = read_be32(hdr);
        if (msg_len > limits.max_frame_bytes) {
            LOG_ERROR("Message size too large: %u bytes (limit %u), closing connection",
                      msg_len, limits.max_frame_bytes);
            sock.close();
            throw ProtocolError(ErrorKind::MessageTooLarge,
                                "declared length " + std::to_string(msg_len) + " exceeds limit of " +
                                    std::to_string(limits.max_frame_bytes));
        }

        std::string body(msg_len, '\0');
        size_t body_got = 0;
        {
            ScopedReadTimeout guard(sock, limits.body_timeout(msg_len));
            body_got = read_upto(sock, reinterpret_cast<uint8_t*>(&body[0]), msg_len, limits.read_chunk_bytes);
        }
        if (body_got < msg_len) {
            throw ProtocolError(ErrorKind::ConnectionError,
                                "connection closed mid-message after " + std::to_string(body_got) + " of " +
                                    std::to_string(msg_len) + " body bytes");
        }

        Envelope envelope = Envelope::deserialize(body);
        LOG_DEBUG("received '%s' (%u bytes)", envelope.type().c_str(), msg_len);
        return envelope;
    } catch (const ProtocolError& e) {
        if (e.kind() == ErrorKind::Timeout) {
            LOG_DEBUG("receive failed: %s: %s", to_string(e.kind()), e.what());
        } else {
            LOG_ERROR("receive failed: %s: %s", to_string(e.kind()), e.what());
        }
        throw;
    }
}

}

#include "framing.hpp"

namespace framelink {

void write_be32(uint32_t v, uint8_t out[4]) {
    out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(v & 0xFF);
}

uint32_t read_be32(const uint8_t in[4]) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

std::vector<uint8_t> build_frame(const std::string& body) {
    std::vector<uint8_t> frame;
    frame.reserve(kHeaderBytes + body.size());

    uint8_t len[4];
    write_be32(static_cast<uint32_t>(body.size()), len);
    frame.insert(frame.end(), len, len + 4);
    frame.insert(frame.end(), body.begin(), body.end());

    return frame;
}

}

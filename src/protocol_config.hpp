#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace framelink {

constexpr uint32_t kDefaultMaxFrameBytes = 10u * 1024u * 1024u;
constexpr size_t kMiB = 1024u * 1024u;

struct ProtocolLimits {
    uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
    // Bounds the wait for the next frame to begin.
    std::chrono::milliseconds header_timeout{10000};
    // Per-read inactivity bound for the body: floor + per_mib for every started MiB.
    std::chrono::milliseconds body_timeout_floor{30000};
    std::chrono::milliseconds body_timeout_per_mib{5000};
    size_t read_chunk_bytes = 8192;

    std::chrono::milliseconds body_timeout(uint32_t msg_len) const {
        const auto started_mib = (static_cast<size_t>(msg_len) + kMiB - 1) / kMiB;
        return body_timeout_floor + body_timeout_per_mib * static_cast<long long>(started_mib);
    }

    bool validate() const {
        if (max_frame_bytes == 0 || read_chunk_bytes == 0) {
            return false;
        }
        if (header_timeout.count() <= 0 || body_timeout_floor.count() <= 0) {
            return false;
        }
        return body_timeout_per_mib.count() >= 0;
    }
};

} // namespace framelink

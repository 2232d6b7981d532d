#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "message_types.hpp"
#include "protocol_config.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace framelink {

// Parses a --max-frame value. Throws std::invalid_argument or std::out_of_range instead of wrapping.
inline uint32_t parse_frame_limit(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("frame limit must be a decimal byte count: " + text);
    }
    const unsigned long long value = std::stoull(text);
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::out_of_range("frame limit does not fit in 32 bits: " + text);
    }
    return static_cast<uint32_t>(value);
}

struct AppConfig {
    std::string mode;
    std::string host = kDefaultHost;
    int port = kDefaultPort;
    std::string message_type = "ping";
    std::string log_path;
    bool debug = false;
    ProtocolLimits limits;

    bool validate() const {
        if (mode != "listen" && mode != "connect") {
            return false;
        }
        if (port < 0 || port > 65535) {
            return false;
        }
        if (mode == "connect" && (host.empty() || port == 0 || message_type.empty())) {
            return false;
        }
        return limits.validate();
    }
};

} // namespace framelink

#endif // APP_CONFIG_HPP

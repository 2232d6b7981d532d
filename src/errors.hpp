#ifndef FRAMELINK_ERRORS_HPP
#define FRAMELINK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace framelink {

// End of stream is not in this set: read_message() reports it as an empty optional.
enum class ErrorKind {
    Timeout,          // socket timeout; the socket may be retried
    ConnectionError,  // peer lost or socket unusable; tear down
    MessageTooLarge,  // declared length over the limit; socket already closed by the reader
    MalformedPayload  // body received in full but not decodable
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::ConnectionError:
        return "connection error";
    case ErrorKind::MessageTooLarge:
        return "message too large";
    case ErrorKind::MalformedPayload:
        return "malformed payload";
    }
    return "unknown";
}

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& what, std::error_code cause = {})
        : std::runtime_error(what), kind_(kind), cause_(cause) {}

    ErrorKind kind() const noexcept { return kind_; }

    // errno of the failing socket call, empty when the failure is not a system error.
    const std::error_code& cause() const noexcept { return cause_; }

    bool connection_usable() const noexcept {
        return kind_ == ErrorKind::Timeout || kind_ == ErrorKind::MalformedPayload;
    }

private:
    ErrorKind kind_;
    std::error_code cause_;
};

} // namespace framelink

#endif // FRAMELINK_ERRORS_HPP

#ifndef FRAMELINK_ENVELOPE_HPP
#define FRAMELINK_ENVELOPE_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace framelink {

using json = nlohmann::json;

// Wire field names, shared with the reference peers.
constexpr const char* kTypeField = "msg_type";
constexpr const char* kPayloadField = "data";

class Envelope {
public:
    // Throws std::invalid_argument for an empty type or a non-object payload.
    // A null payload is taken as an empty object.
    explicit Envelope(std::string type, json payload = json::object());

    const std::string& type() const { return type_; }
    const json& payload() const { return payload_; }

    std::string serialize() const;
    // Throws ProtocolError(MalformedPayload).
    static Envelope deserialize(const std::string& text);

    bool operator==(const Envelope& other) const {
        return type_ == other.type_ && payload_ == other.payload_;
    }
    bool operator!=(const Envelope& other) const { return !(*this == other); }

private:
    std::string type_;
    json payload_;
};

} // namespace framelink

#endif // FRAMELINK_ENVELOPE_HPP

#include "envelope.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace framelink {

Envelope::Envelope(std::string type, json payload)
    : type_(std::move(type)), payload_(std::move(payload)) {
    if (type_.empty()) {
        throw std::invalid_argument("envelope type must not be empty");
    }
    if (payload_.is_null()) {
        payload_ = json::object();
    } else if (!payload_.is_object()) {
        throw std::invalid_argument(std::string("envelope payload must be an object, got ") + payload_.type_name());
    }
}

std::string Envelope::serialize() const {
    json msg = {
        {kTypeField, type_},
        {kPayloadField, payload_}
    };
    try {
        return msg.dump();
    } catch (const json::type_error& e) {
        // invalid UTF-8 inside a string value
        throw ProtocolError(ErrorKind::MalformedPayload,
                            "cannot serialize '" + type_ + "': " + e.what());
    }
}

Envelope Envelope::deserialize(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError(ErrorKind::MalformedPayload, std::string("invalid JSON: ") + e.what());
    }

    if (!msg.is_object()) {
        throw ProtocolError(ErrorKind::MalformedPayload,
                            std::string("message root is ") + msg.type_name() + ", expected object");
    }

    auto type_it = msg.find(kTypeField);
    if (type_it == msg.end() || !type_it->is_string()) {
        throw ProtocolError(ErrorKind::MalformedPayload, "missing or non-string 'msg_type'");
    }
    auto type = type_it->get<std::string>();
    if (type.empty()) {
        throw ProtocolError(ErrorKind::MalformedPayload, "empty 'msg_type'");
    }

    auto data_it = msg.find(kPayloadField);
    if (data_it == msg.end()) {
        throw ProtocolError(ErrorKind::MalformedPayload, "missing 'data' in '" + type + "'");
    }
    if (!data_it->is_object() && !data_it->is_null()) {
        throw ProtocolError(ErrorKind::MalformedPayload,
                            "'data' in '" + type + "' is " + data_it->type_name() + ", expected object");
    }

    return Envelope(std::move(type), std::move(*data_it));
}

} // namespace framelink

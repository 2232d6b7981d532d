#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace framelink {

// RFC 4648 standard alphabet, padded.
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

// Throws ProtocolError(MalformedPayload) on invalid input.
std::vector<uint8_t> base64_decode(const std::string& text);

}

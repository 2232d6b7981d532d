#include "base64.hpp"
#include "errors.hpp"

#include "mbedtls/base64.h"

#include <cstdio>

namespace framelink {

namespace {
    std::string mbedtls_error(int ret) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "-0x%04x", static_cast<unsigned>(-ret));
        return buf;
    }
}

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return std::string();
    }

    size_t needed = 0;
    // Sizing call: reports the output length including the terminating NUL.
    int ret = mbedtls_base64_encode(nullptr, 0, &needed, data, len);
    if (ret != MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL) {
        throw ProtocolError(ErrorKind::MalformedPayload, "mbedtls_base64_encode returned " + mbedtls_error(ret));
    }

    std::string out(needed, '\0');
    size_t written = 0;
    ret = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(&out[0]), out.size(), &written, data, len);
    if (ret != 0) {
        throw ProtocolError(ErrorKind::MalformedPayload, "mbedtls_base64_encode returned " + mbedtls_error(ret));
    }
    out.resize(written);
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    const auto* src = reinterpret_cast<const unsigned char*>(text.data());

    size_t needed = 0;
    int ret = mbedtls_base64_decode(nullptr, 0, &needed, src, text.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        throw ProtocolError(ErrorKind::MalformedPayload, "invalid base64 input");
    }
    if (ret == 0 || needed == 0) {
        return {};
    }
    if (ret != MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL) {
        throw ProtocolError(ErrorKind::MalformedPayload, "mbedtls_base64_decode returned " + mbedtls_error(ret));
    }

    std::vector<uint8_t> out(needed);
    size_t written = 0;
    ret = mbedtls_base64_decode(out.data(), out.size(), &written, src, text.size());
    if (ret != 0) {
        throw ProtocolError(ErrorKind::MalformedPayload, "mbedtls_base64_decode returned " + mbedtls_error(ret));
    }
    out.resize(written);
    return out;
}

}

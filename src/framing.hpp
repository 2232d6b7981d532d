#pragma once

#include "envelope.hpp"
#include "protocol_config.hpp"
#include "socket.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace framelink {

constexpr size_t kHeaderBytes = 4;

// Frame format:
// [len:4 big-endian][body:len UTF-8 JSON]
// len counts body bytes only.
std::vector<uint8_t> build_frame(const std::string& body);

void write_be32(uint32_t v, uint8_t out[4]);
uint32_t read_be32(const uint8_t in[4]);

// Writes one whole frame or throws ProtocolError:
//  - Timeout          send timeout expired
//  - ConnectionError  peer reset/closed, or any other socket failure
//  - MessageTooLarge  body over limits.max_frame_bytes; nothing is written
//  - MalformedPayload payload is not serializable as UTF-8 JSON
// Concurrent writers on one socket must be serialized by the caller.
void write_message(Socket& sock, const Envelope& envelope, const ProtocolLimits& limits = ProtocolLimits{});

// Reads one frame. An empty optional is a clean close by the peer between frames.
// Throws ProtocolError:
//  - Timeout          header or body read timed out
//  - ConnectionError  peer lost mid-frame, or the socket was closed locally
//  - MessageTooLarge  declared length over limits.max_frame_bytes; the socket is closed
//  - MalformedPayload body is not a valid envelope; the stream stays frame-aligned
// The socket's read timeout is restored on every path that leaves it open.
std::optional<Envelope> read_message(Socket& sock, const ProtocolLimits& limits = ProtocolLimits{});

}

#include "errors.hpp"
#include "framing.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using framelink::Envelope;
using framelink::ErrorKind;
using framelink::ProtocolError;
using framelink::ProtocolLimits;
using framelink::Socket;
using framelink::json;
using std::chrono::milliseconds;

namespace {

const milliseconds kAmbient{3000};

std::vector<uint8_t> header_for(uint32_t len) {
    std::vector<uint8_t> hdr(4);
    framelink::write_be32(len, hdr.data());
    return hdr;
}

void send_raw(Socket& s, const std::vector<uint8_t>& bytes) {
    s.send_all(bytes.data(), bytes.size());
}

void send_raw_body(Socket& s, const std::string& body) {
    send_raw(s, framelink::build_frame(body));
}

// Runs read_message and reports the failure kind, if any.
std::optional<ErrorKind> read_failure(Socket& s, const ProtocolLimits& limits = ProtocolLimits{}) {
    try {
        framelink::read_message(s, limits);
    } catch (const ProtocolError& e) {
        return e.kind();
    }
    return std::nullopt;
}

bool test_ping_scenario() {
    auto sockets = Socket::pair();
    framelink::write_message(sockets.second, Envelope("ping", json::object()));

    auto msg = framelink::read_message(sockets.first);
    if (!msg || msg->type() != "ping" || !msg->payload().is_object() || !msg->payload().empty()) {
        std::cerr << "[ping] unexpected result\n";
        return false;
    }
    return true;
}

bool test_back_to_back_frames() {
    auto sockets = Socket::pair();
    for (int i = 0; i < 3; ++i) {
        framelink::write_message(sockets.second, Envelope("SERVER_MESSAGE", {{"seq", i}}));
    }
    for (int i = 0; i < 3; ++i) {
        auto msg = framelink::read_message(sockets.first);
        if (!msg || msg->payload().at("seq") != i) {
            std::cerr << "[batch] frame " << i << " lost or reordered\n";
            return false;
        }
    }
    return true;
}

bool test_graceful_close_is_end_of_stream() {
    auto sockets = Socket::pair();
    framelink::write_message(sockets.second, Envelope("LOGOUT"));
    sockets.second.close();

    auto first = framelink::read_message(sockets.first);
    auto second = framelink::read_message(sockets.first);
    if (!first || first->type() != "LOGOUT" || second.has_value()) {
        std::cerr << "[graceful] expected one frame then end of stream\n";
        return false;
    }
    return sockets.first.is_open();
}

bool test_close_mid_header() {
    auto sockets = Socket::pair();
    send_raw(sockets.second, {0x00, 0x00});
    sockets.second.close();

    auto kind = read_failure(sockets.first);
    if (kind != ErrorKind::ConnectionError) {
        std::cerr << "[mid-header] expected ConnectionError\n";
        return false;
    }
    return true;
}

bool test_close_mid_body() {
    auto sockets = Socket::pair();
    auto bytes = header_for(100);
    bytes.insert(bytes.end(), 10, 'x');
    send_raw(sockets.second, bytes);
    sockets.second.close();

    try {
        auto msg = framelink::read_message(sockets.first);
        std::cerr << "[mid-body] returned " << (msg ? "a message" : "end of stream") << "\n";
        return false;
    } catch (const ProtocolError& e) {
        if (e.kind() != ErrorKind::ConnectionError) {
            std::cerr << "[mid-body] wrong kind: " << framelink::to_string(e.kind()) << "\n";
            return false;
        }
    }
    return true;
}

bool test_size_guard() {
    auto sockets = Socket::pair();
    ProtocolLimits limits;
    limits.max_frame_bytes = 10000000;

    // Only the header is sent: any attempt to read the body would block for the body timeout.
    send_raw(sockets.second, header_for(200000000));

    const auto start = std::chrono::steady_clock::now();
    auto kind = read_failure(sockets.first, limits);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    if (kind != ErrorKind::MessageTooLarge) {
        std::cerr << "[size-guard] expected MessageTooLarge\n";
        return false;
    }
    if (sockets.first.is_open()) {
        std::cerr << "[size-guard] socket left open\n";
        return false;
    }
    if (elapsed > std::chrono::seconds(2)) {
        std::cerr << "[size-guard] reader waited on the body\n";
        return false;
    }
    return true;
}

bool test_trickled_bytes() {
    auto sockets = Socket::pair();
    Envelope in("QUERY_RESULT", {{"rows", json::array({1, 2, 3})}, {"note", std::string(200, 'n')}});
    auto frame = framelink::build_frame(in.serialize());

    std::thread writer([&sockets, &frame] {
        for (uint8_t b : frame) {
            sockets.second.send_all(&b, 1);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });
    auto out = framelink::read_message(sockets.first);
    writer.join();

    if (!out || *out != in) {
        std::cerr << "[trickle] envelope not reconstructed\n";
        return false;
    }
    return true;
}

bool test_large_body_in_chunks() {
    auto sockets = Socket::pair();
    ProtocolLimits limits;
    limits.read_chunk_bytes = 1000;
    Envelope in("QUERY_RESULT", {{"table", std::string(3u * 1024u * 1024u, 'T')}});

    std::thread writer([&sockets, &in] { framelink::write_message(sockets.second, in); });
    auto out = framelink::read_message(sockets.first, limits);
    writer.join();

    return out && *out == in;
}

bool test_malformed_body_keeps_stream_aligned() {
    auto sockets = Socket::pair();
    send_raw_body(sockets.second, "this is not json");
    send_raw_body(sockets.second, std::string("\xff\xfe\xfd"));
    send_raw_body(sockets.second, "");
    send_raw_body(sockets.second, R"({"msg_type":"QUERY"})");
    framelink::write_message(sockets.second, Envelope("ping"));

    for (int i = 0; i < 4; ++i) {
        if (read_failure(sockets.first) != ErrorKind::MalformedPayload) {
            std::cerr << "[malformed] frame " << i << " not reported as MalformedPayload\n";
            return false;
        }
    }
    auto msg = framelink::read_message(sockets.first);
    if (!msg || msg->type() != "ping") {
        std::cerr << "[malformed] stream lost alignment\n";
        return false;
    }
    return true;
}

bool test_header_timeout_restores_ambient() {
    auto sockets = Socket::pair();
    sockets.first.set_read_timeout(kAmbient);
    ProtocolLimits limits;
    limits.header_timeout = milliseconds(200);

    const auto start = std::chrono::steady_clock::now();
    auto kind = read_failure(sockets.first, limits);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    if (kind != ErrorKind::Timeout) {
        std::cerr << "[header-timeout] expected Timeout\n";
        return false;
    }
    if (elapsed >= kAmbient) {
        std::cerr << "[header-timeout] header timeout not applied\n";
        return false;
    }
    if (sockets.first.read_timeout() != kAmbient) {
        std::cerr << "[header-timeout] ambient timeout not restored\n";
        return false;
    }
    return true;
}

bool test_body_timeout_restores_ambient() {
    auto sockets = Socket::pair();
    sockets.first.set_read_timeout(kAmbient);
    ProtocolLimits limits;
    limits.body_timeout_floor = milliseconds(300);
    limits.body_timeout_per_mib = milliseconds(0);

    // Header promises 64 bytes, only 10 arrive.
    send_raw(sockets.second, header_for(64));
    const std::string partial = "{\"msg_type\"";
    sockets.second.send_all(partial.data(), partial.size());

    const auto start = std::chrono::steady_clock::now();
    auto kind = read_failure(sockets.first, limits);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    if (kind != ErrorKind::Timeout) {
        std::cerr << "[body-timeout] expected Timeout\n";
        return false;
    }
    if (elapsed >= kAmbient) {
        std::cerr << "[body-timeout] body timeout not applied\n";
        return false;
    }
    if (sockets.first.read_timeout() != kAmbient) {
        std::cerr << "[body-timeout] ambient timeout not restored\n";
        return false;
    }
    return true;
}

bool test_body_timeout_scales_with_length() {
    const ProtocolLimits limits;
    const std::uint32_t mib = 1024u * 1024u;
    if (limits.body_timeout(0) != milliseconds(30000) || limits.body_timeout(1) != milliseconds(35000)) {
        std::cerr << "[body-timeout-formula] wrong floor\n";
        return false;
    }
    if (limits.body_timeout(mib) != milliseconds(35000) || limits.body_timeout(mib + 1) != milliseconds(40000)) {
        std::cerr << "[body-timeout-formula] started MiB not counted\n";
        return false;
    }
    if (limits.body_timeout(10 * mib) != milliseconds(80000)) {
        std::cerr << "[body-timeout-formula] 10 MiB frame\n";
        return false;
    }
    return true;
}

bool test_timeout_restored_after_success_and_decode_error() {
    auto sockets = Socket::pair();
    sockets.first.set_read_timeout(kAmbient);

    framelink::write_message(sockets.second, Envelope("ping"));
    framelink::read_message(sockets.first);
    if (sockets.first.read_timeout() != kAmbient) {
        std::cerr << "[restore] not restored after success\n";
        return false;
    }

    send_raw_body(sockets.second, "{");
    read_failure(sockets.first);
    if (sockets.first.read_timeout() != kAmbient) {
        std::cerr << "[restore] not restored after decode failure\n";
        return false;
    }
    return true;
}

bool test_local_close_aborts_pending_read() {
    auto sockets = Socket::pair();
    std::optional<ErrorKind> kind;
    bool returned_end_of_stream = false;

    std::thread reader([&] {
        try {
            auto msg = framelink::read_message(sockets.first);
            returned_end_of_stream = !msg.has_value();
        } catch (const ProtocolError& e) {
            kind = e.kind();
        }
    });
    std::this_thread::sleep_for(milliseconds(100));
    sockets.first.close();
    reader.join();

    if (returned_end_of_stream || kind != ErrorKind::ConnectionError) {
        std::cerr << "[local-close] expected ConnectionError\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_ping_scenario();
    ok = ok && test_back_to_back_frames();
    ok = ok && test_graceful_close_is_end_of_stream();
    ok = ok && test_close_mid_header();
    ok = ok && test_close_mid_body();
    ok = ok && test_size_guard();
    ok = ok && test_trickled_bytes();
    ok = ok && test_large_body_in_chunks();
    ok = ok && test_malformed_body_keeps_stream_aligned();
    ok = ok && test_header_timeout_restores_ambient();
    ok = ok && test_body_timeout_restores_ambient();
    ok = ok && test_body_timeout_scales_with_length();
    ok = ok && test_timeout_restored_after_success_and_decode_error();
    ok = ok && test_local_close_aborts_pending_read();

    if (!ok) {
        std::cerr << "FrameReader tests FAILED\n";
        return 1;
    }

    std::cout << "FrameReader tests PASSED\n";
    return 0;
}

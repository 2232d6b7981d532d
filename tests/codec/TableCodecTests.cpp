#include "base64.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "table.hpp"

#include <iostream>
#include <stdexcept>

using framelink::Envelope;
using framelink::ErrorKind;
using framelink::ProtocolError;
using framelink::Table;
using framelink::json;

namespace {

Table arrests_by_area() {
    Table t;
    t.columns = {"area", "arrests", "delta", "share", "flagged", "note"};
    t.rows.push_back({"Central", 1520, -12, 0.1, true, nullptr});
    t.rows.push_back({"Hollywood", 987, 4, 0.065, false, "caf\xc3\xa9"});
    t.rows.push_back({"Van Nuys", 3000000000LL, 0, 1e-9, false, ""});
    return t;
}

bool expect_malformed(const std::string& text, const char* label) {
    try {
        framelink::decode_table(text);
        std::cerr << "[" << label << "] accepted\n";
        return false;
    } catch (const ProtocolError& e) {
        return e.kind() == ErrorKind::MalformedPayload;
    }
}

bool test_round_trip() {
    const Table in = arrests_by_area();
    const std::string text = framelink::encode_table(in);
    const Table out = framelink::decode_table(text);
    if (out != in) {
        std::cerr << "[round-trip] table changed\n";
        return false;
    }
    return out.row_count() == 3 && out.column_count() == 6;
}

bool test_empty_table() {
    Table in;
    return framelink::decode_table(framelink::encode_table(in)) == in;
}

bool test_through_envelope() {
    const Table in = arrests_by_area();
    Envelope msg("QUERY_RESULT", {{"status", "OK"}, {"result", framelink::encode_table(in)}});
    Envelope received = Envelope::deserialize(msg.serialize());
    return framelink::decode_table(received.payload().at("result").get<std::string>()) == in;
}

bool test_ragged_rows_rejected() {
    Table t = arrests_by_area();
    t.rows[1].pop_back();
    try {
        framelink::encode_table(t);
        std::cerr << "[ragged] encoded\n";
        return false;
    } catch (const std::invalid_argument&) {
        return true;
    }
}

bool test_malformed_input() {
    bool ok = true;
    ok = expect_malformed("%%%%", "bad base64") && ok;
    // 0xc1 is never used in MessagePack.
    ok = expect_malformed(framelink::base64_encode(std::vector<uint8_t>{0xc1}), "bad msgpack") && ok;
    ok = expect_malformed(framelink::base64_encode(json::to_msgpack(json::array({1, 2}))), "array root") && ok;
    ok = expect_malformed(framelink::base64_encode(json::to_msgpack(json{{"columns", {"a", "b"}}, {"data", {{1}}}})),
                          "short row") && ok;
    ok = expect_malformed(framelink::base64_encode(json::to_msgpack(json{{"columns", {1}}, {"data", json::array()}})),
                          "numeric column name") && ok;
    return ok;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_round_trip();
    ok = ok && test_empty_table();
    ok = ok && test_through_envelope();
    ok = ok && test_ragged_rows_rejected();
    ok = ok && test_malformed_input();

    if (!ok) {
        std::cerr << "TableCodec tests FAILED\n";
        return 1;
    }

    std::cout << "TableCodec tests PASSED\n";
    return 0;
}

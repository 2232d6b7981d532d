#include "table.hpp"
#include "base64.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace framelink {

using json = nlohmann::json;

std::string encode_table(const Table& table) {
    json data = json::array();
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& row = table.rows[i];
        if (row.size() != table.columns.size()) {
            throw std::invalid_argument("row " + std::to_string(i) + " has " + std::to_string(row.size()) +
                                        " cells, expected " + std::to_string(table.columns.size()));
        }
        data.push_back(json(row));
    }

    json doc = {
        {"columns", table.columns},
        {"data", std::move(data)}
    };
    return base64_encode(json::to_msgpack(doc));
}

Table decode_table(const std::string& text) {
    const std::vector<uint8_t> packed = base64_decode(text);

    json doc;
    try {
        doc = json::from_msgpack(packed);
    } catch (const json::exception& e) {
        throw ProtocolError(ErrorKind::MalformedPayload, std::string("table is not valid MessagePack: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("columns") || !doc.contains("data") ||
        !doc["columns"].is_array() || !doc["data"].is_array()) {
        throw ProtocolError(ErrorKind::MalformedPayload, "table must be an object with 'columns' and 'data' arrays");
    }

    Table table;
    for (const auto& name : doc["columns"]) {
        if (!name.is_string()) {
            throw ProtocolError(ErrorKind::MalformedPayload, "column names must be strings");
        }
        table.columns.push_back(name.get<std::string>());
    }

    for (const auto& row : doc["data"]) {
        if (!row.is_array() || row.size() != table.columns.size()) {
            throw ProtocolError(ErrorKind::MalformedPayload,
                                "table row does not have " + std::to_string(table.columns.size()) + " cells");
        }
        table.rows.emplace_back(row.begin(), row.end());
    }
    return table;
}

} // namespace framelink

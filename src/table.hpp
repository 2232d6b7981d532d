#ifndef FRAMELINK_TABLE_HPP
#define FRAMELINK_TABLE_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace framelink {

// Tabular query result. Cells are JSON scalars (null, bool, number, string), row-major.
struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    size_t column_count() const { return columns.size(); }
    size_t row_count() const { return rows.size(); }

    bool operator==(const Table& other) const {
        return columns == other.columns && rows == other.rows;
    }
    bool operator!=(const Table& other) const { return !(*this == other); }
};

// MessagePack {"columns": [...], "data": [[...]]}, then base64.
// Throws std::invalid_argument if a row does not have one cell per column.
std::string encode_table(const Table& table);

// Throws ProtocolError(MalformedPayload).
Table decode_table(const std::string& text);

} // namespace framelink

#endif // FRAMELINK_TABLE_HPP

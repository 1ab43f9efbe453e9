#include "format/csv_codec.hpp"
#include "core/error.hpp"

#include <format>

namespace docanon::csv {

std::vector<Row> parse(std::string_view content, char delimiter) {
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }

    std::vector<Row> rows;
    Row row;
    std::string field;
    bool in_quotes = false;
    bool row_started = false;
    size_t line = 1;
    size_t quote_line = 0;

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            quote_line = line;
            row_started = true;
        } else if (c == delimiter) {
            row.push_back(std::move(field));
            field.clear();
            row_started = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') ++i;
            ++line;
            row.push_back(std::move(field));
            field.clear();
            rows.push_back(std::move(row));
            row.clear();
            row_started = false;
        } else {
            field += c;
            row_started = true;
        }
    }

    if (in_quotes) {
        throw DocumentError(std::format("CSV: unterminated quoted field starting on line {}", quote_line));
    }

    if (row_started || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string escape_field(std::string_view field, char delimiter) {
    const bool needs_quotes = field.find_first_of(std::string{delimiter, '"', '\r', '\n'}) != std::string_view::npos;
    if (!needs_quotes) return std::string(field);

    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string write(const std::vector<Row>& rows, char delimiter) {
    std::string out;
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out += delimiter;
            out += escape_field(row[i], delimiter);
        }
        out += '\n';
    }
    return out;
}

} // namespace docanon::csv

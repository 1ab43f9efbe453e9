#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docanon::csv {

using Row = std::vector<std::string>;

/**
 * @brief Parse RFC 4180 CSV (quoted fields, doubled quotes, CRLF or LF)
 *
 * A leading UTF-8 BOM is skipped. A trailing newline does not produce an
 * empty final record. Rows keep their own width; ragged input stays ragged.
 *
 * @throws DocumentError on an unterminated quoted field
 */
[[nodiscard]] std::vector<Row> parse(std::string_view content, char delimiter = ',');

/**
 * @brief Quote a field only when it contains the delimiter, a quote, CR or LF
 */
[[nodiscard]] std::string escape_field(std::string_view field, char delimiter = ',');

/**
 * @brief Serialize rows with minimal quoting, one "\n"-terminated line each
 */
[[nodiscard]] std::string write(const std::vector<Row>& rows, char delimiter = ',');

} // namespace docanon::csv

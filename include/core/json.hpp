#pragma once

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace docanon::json {

/**
 * @brief Thin helpers around glaze
 *
 * glz::json_t is used for validation and navigation only. It stores numbers
 * as double and keeps object keys sorted (std::map), so documents that must
 * round-trip are never re-serialized from it.
 */
using Value = glz::json_t;

struct parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

[[nodiscard]] inline Value parse(const std::string& json_str) {
    Value result;
    auto ec = glz::read_json(result, json_str);
    if (ec) {
        throw parse_error(glz::format_error(ec, json_str));
    }
    return result;
}

/**
 * @brief Decode one quoted JSON string literal, escapes resolved
 */
[[nodiscard]] inline std::string decode_string(std::string_view literal) {
    // glaze expects a null-terminated buffer
    const std::string buffer(literal);
    std::string result;
    auto ec = glz::read_json(result, buffer);
    if (ec) {
        throw parse_error(glz::format_error(ec, buffer));
    }
    return result;
}

/**
 * @brief Quoted, escaped JSON literal for `value`; non-ASCII UTF-8 is written as-is
 */
[[nodiscard]] inline std::string encode_string(const std::string& value) {
    std::string buffer;
    auto ec = glz::write<glz::opts{}>(value, buffer);
    if (ec) {
        throw std::runtime_error("JSON serialization failed");
    }
    return buffer;
}

} // namespace docanon::json

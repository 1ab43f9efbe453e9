#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docanon {

/**
 * @brief Image-to-text capability
 *
 * Best effort: any decoding or recognition failure yields an empty string,
 * never an exception. An empty result anonymizes to itself downstream.
 */
class IOcrExtractor {
public:
    virtual ~IOcrExtractor() = default;

    [[nodiscard]] virtual std::string extract(const std::vector<uint8_t>& image_bytes) noexcept = 0;
};

/**
 * @brief OCR stand-in used when OCR is disabled in the config
 */
class NullOcrExtractor : public IOcrExtractor {
public:
    std::string extract(const std::vector<uint8_t>& /*image_bytes*/) noexcept override {
        return {};
    }
};

} // namespace docanon

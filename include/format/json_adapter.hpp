#pragma once

#include "format/iformat_adapter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace docanon {

/**
 * @brief Nested key/value document: one unit per leaf string
 *
 * Leaves are collected in document order (object members as written, array
 * elements by index). Reconstruction splices the replacement literals into
 * the source text, so keys, member order, numbers (digit for digit),
 * booleans, nulls and whitespace come out exactly as they went in.
 */
class JsonAdapter : public IFormatAdapter {
public:
    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".json"; }

    /**
     * @brief A string value (never a key) located in the source text
     */
    struct StringLeaf {
        size_t begin = 0;   // opening quote
        size_t end = 0;     // one past the closing quote
        std::string path;   // $.key[0].key
        std::string text;   // decoded value
    };

private:
    std::string source_;
    std::vector<StringLeaf> leaves_;
    bool extracted_ = false;
};

} // namespace docanon

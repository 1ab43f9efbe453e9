#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docanon {

/**
 * @brief Original unit text -> anonymized text
 *
 * Content-keyed: every occurrence of the same original string receives the
 * same replacement, wherever it sits in the document.
 */
using TranslationMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Per-format extract / reconstruct pair
 *
 * One adapter instance handles one document: extract() parses the container
 * and keeps whatever it needs to rebuild it; reconstruct() writes the output
 * from that state and the translation map. Units whose text is missing from
 * the map are written back unchanged.
 *
 * Documents and outputs are byte strings (UTF-8 text or binary containers).
 */
class IFormatAdapter {
public:
    virtual ~IFormatAdapter() = default;

    /**
     * @throws DocumentError if the container cannot be parsed
     */
    [[nodiscard]] virtual std::vector<StructuralUnit> extract(const std::string& document) = 0;

    /**
     * @throws DocumentError if called before extract() or the output cannot be built
     */
    [[nodiscard]] virtual std::string reconstruct(const TranslationMap& mapping) = 0;

    /**
     * @brief Extension of the produced file, including the dot
     */
    [[nodiscard]] virtual std::string_view output_extension() const = 0;

protected:
    /**
     * @brief Replacement for `original`, or `original` itself when unmapped
     */
    [[nodiscard]] static const std::string& translate(const TranslationMap& mapping,
                                                      const std::string& original) {
        const auto it = mapping.find(original);
        return it != mapping.end() ? it->second : original;
    }
};

} // namespace docanon

#pragma once

#include "core/types.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace docanon {

/**
 * @brief Sensitive-span detection capability
 *
 * Implementations must return spans with score >= score_threshold whose
 * entity_type is in `entity_types`, ordered by start offset. Spans may
 * overlap; overlap resolution belongs to the caller.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    [[nodiscard]] virtual std::vector<DetectedSpan> analyze(
        const std::string& text,
        const std::string& language,
        double score_threshold,
        const std::unordered_set<std::string>& entity_types) = 0;

    /**
     * @brief Analyze several independent texts
     *
     * Output has one span list per input, in input order. The default loops
     * over analyze(); a model-backed detector can override to batch.
     */
    [[nodiscard]] virtual std::vector<std::vector<DetectedSpan>> analyze_batch(
        const std::vector<std::string>& texts,
        const std::string& language,
        double score_threshold,
        const std::unordered_set<std::string>& entity_types) {
        std::vector<std::vector<DetectedSpan>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(analyze(text, language, score_threshold, entity_types));
        }
        return out;
    }

    /**
     * @brief Entity types this detector can report for `language`
     */
    [[nodiscard]] virtual std::vector<std::string> supported_entities(
        const std::string& language) const = 0;
};

} // namespace docanon

#pragma once

#include "anon/slug_generator.hpp"
#include "core/types.hpp"
#include "detector/ientity_detector.hpp"
#include "registry/entity_registry.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace docanon {

/**
 * @brief Detect -> filter -> resolve -> replace -> persist
 *
 * One instance per run. Owns the run counters and the slug generator; the
 * detector and registry are borrowed and must outlive the orchestrator.
 * Without a registry, tokens are produced but nothing is persisted.
 *
 * Overlapping spans: the leftmost start wins; equal starts go to the higher
 * score, then the longer span, then the lexically smaller entity type. Every
 * span overlapping an accepted one is dropped.
 */
class Orchestrator {
public:
    /**
     * @throws ConfigurationError if the key is empty or slug_length is invalid
     */
    Orchestrator(AnonymizationConfig config,
                 IEntityDetector& detector,
                 const SecretKey& key,
                 EntityRegistry* registry = nullptr);

    /**
     * @brief Anonymize one text and persist its entities in one registry write
     *
     * Blank text is returned unchanged without calling the detector.
     */
    std::string anonymize_text(const std::string& text);

    /**
     * @brief Anonymize many independent texts
     *
     * The detector runs over chunks of `batch_size` texts; the registry is
     * written once for the whole call. Output order matches input order.
     *
     * @throws std::invalid_argument if batch_size is 0
     */
    std::vector<std::string> anonymize_batch(const std::vector<std::string>& texts,
                                             size_t batch_size = kDefaultBatchSize);

    [[nodiscard]] const RunCounters& counters() const { return counters_; }
    [[nodiscard]] const AnonymizationConfig& config() const { return config_; }

    /**
     * @brief Entity types sent to the detector (supported minus preserved)
     */
    [[nodiscard]] const std::unordered_set<std::string>& active_entity_types() const {
        return entity_types_;
    }

    /**
     * @brief Apply the overlap policy; result is ordered by start
     */
    [[nodiscard]] static std::vector<DetectedSpan> resolve_overlaps(std::vector<DetectedSpan> spans);

private:
    std::string apply_spans(const std::string& text,
                            std::vector<DetectedSpan> spans,
                            std::vector<CollectedEntity>& collector);

    void persist(const std::vector<CollectedEntity>& collected);

    AnonymizationConfig config_;
    IEntityDetector& detector_;
    EntityRegistry* registry_;
    SlugGenerator slugs_;
    RunCounters counters_;
    std::unordered_set<std::string> entity_types_;
};

} // namespace docanon

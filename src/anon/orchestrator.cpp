#include "anon/orchestrator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace docanon {

Orchestrator::Orchestrator(AnonymizationConfig config,
                           IEntityDetector& detector,
                           const SecretKey& key,
                           EntityRegistry* registry)
    : config_(std::move(config)),
      detector_(detector),
      registry_(registry),
      slugs_(key, config_.slug_length) {

    const auto supported = detector_.supported_entities(config_.language);
    for (const auto& type : supported) {
        if (!config_.preserve_entity_types.count(type)) {
            entity_types_.insert(type);
        }
    }

    for (const auto& type : config_.preserve_entity_types) {
        if (std::find(supported.begin(), supported.end(), type) == supported.end()) {
            utils::log::warn(std::format(
                "Preserved entity type '{}' is not recognized and will be ignored", type));
        }
    }
}

std::vector<DetectedSpan> Orchestrator::resolve_overlaps(std::vector<DetectedSpan> spans) {
    std::sort(spans.begin(), spans.end(), [](const DetectedSpan& a, const DetectedSpan& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.score != b.score) return a.score > b.score;
        if (a.length() != b.length()) return a.length() > b.length();
        return a.entity_type < b.entity_type;
    });

    std::vector<DetectedSpan> kept;
    size_t covered_until = 0;
    for (auto& span : spans) {
        if (!kept.empty() && span.start < covered_until) continue;
        covered_until = span.end;
        kept.push_back(std::move(span));
    }
    return kept;
}

std::string Orchestrator::apply_spans(const std::string& text,
                                      std::vector<DetectedSpan> spans,
                                      std::vector<CollectedEntity>& collector) {
    std::erase_if(spans, [&](const DetectedSpan& s) {
        if (s.start >= s.end || s.end > text.size()) {
            utils::log::warn(std::format("Detector returned out-of-range span [{}, {}) for {}-byte text",
                s.start, s.end, text.size()));
            return true;
        }
        return config_.allow_list.count(text.substr(s.start, s.length())) > 0;
    });

    const auto kept = resolve_overlaps(std::move(spans));
    if (kept.empty()) return text;

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const auto& span : kept) {
        out.append(text, cursor, span.start - cursor);
        out += slugs_.generate(std::string_view(text).substr(span.start, span.length()),
                               span.entity_type, collector, counters_);
        cursor = span.end;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

void Orchestrator::persist(const std::vector<CollectedEntity>& collected) {
    if (!registry_ || collected.empty()) return;
    registry_->bulk_upsert(collected);
}

std::string Orchestrator::anonymize_text(const std::string& text) {
    if (utils::is_blank(text)) return text;

    std::vector<CollectedEntity> collected;
    std::vector<DetectedSpan> spans;
    if (!entity_types_.empty()) {
        spans = detector_.analyze(text, config_.language, config_.score_threshold, entity_types_);
    }
    auto out = apply_spans(text, std::move(spans), collected);
    persist(collected);
    return out;
}

std::vector<std::string> Orchestrator::anonymize_batch(const std::vector<std::string>& texts,
                                                       size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be greater than 0");
    }

    std::vector<std::string> out(texts);

    // Blank texts pass through untouched and are never sent to the detector
    std::vector<size_t> pending;
    pending.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        if (!utils::is_blank(texts[i])) pending.push_back(i);
    }
    if (pending.empty() || entity_types_.empty()) return out;

    std::vector<CollectedEntity> collected;
    for (size_t offset = 0; offset < pending.size(); offset += batch_size) {
        const size_t n = std::min(batch_size, pending.size() - offset);

        std::vector<std::string> chunk;
        chunk.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            chunk.push_back(texts[pending[offset + i]]);
        }

        auto results = detector_.analyze_batch(chunk, config_.language,
                                               config_.score_threshold, entity_types_);
        if (results.size() != chunk.size()) {
            throw std::runtime_error(std::format(
                "Detector returned {} results for a batch of {}", results.size(), chunk.size()));
        }

        for (size_t i = 0; i < n; ++i) {
            const size_t idx = pending[offset + i];
            out[idx] = apply_spans(texts[idx], std::move(results[i]), collected);
        }
    }

    persist(collected);
    return out;
}

} // namespace docanon

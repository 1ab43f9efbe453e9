#include "pipeline/document_pipeline.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace docanon {

DocumentPipeline::DocumentPipeline(Orchestrator& orchestrator, size_t batch_size)
    : orchestrator_(orchestrator), batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("batch_size must be greater than 0");
    }
}

std::string DocumentPipeline::process(IFormatAdapter& adapter, const std::string& document) {
    const auto units = adapter.extract(document);
    last_unit_count_ = units.size();

    std::vector<std::string> texts;
    texts.reserve(units.size());
    for (const auto& unit : units) {
        texts.push_back(unit.text);
    }

    const auto anonymized = orchestrator_.anonymize_batch(texts, batch_size_);

    TranslationMap mapping;
    mapping.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        mapping.try_emplace(texts[i], anonymized[i]);
    }

    utils::log::debug(std::format("pipeline: {} units, {} distinct", units.size(), mapping.size()));
    return adapter.reconstruct(mapping);
}

} // namespace docanon

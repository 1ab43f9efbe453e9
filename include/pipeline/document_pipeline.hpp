#pragma once

#include "anon/orchestrator.hpp"
#include "format/iformat_adapter.hpp"

#include <string>

namespace docanon {

/**
 * @brief extract -> one anonymize_batch over every unit -> reconstruct
 *
 * Unit texts go to the orchestrator in document order (occurrences are
 * counted, not deduplicated). The resulting translation map is keyed by
 * original text, so identical strings anywhere in the document receive the
 * same replacement.
 */
class DocumentPipeline {
public:
    DocumentPipeline(Orchestrator& orchestrator, size_t batch_size = kDefaultBatchSize);

    /**
     * @return reconstructed document bytes
     * @throws DocumentError on parse / rebuild failure
     */
    std::string process(IFormatAdapter& adapter, const std::string& document);

    /**
     * @brief Units extracted by the last process() call
     */
    [[nodiscard]] size_t last_unit_count() const { return last_unit_count_; }

private:
    Orchestrator& orchestrator_;
    size_t batch_size_;
    size_t last_unit_count_ = 0;
};

} // namespace docanon

#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "detector/pattern_detector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace docanon {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct AnonymizationSection {
    std::string language = "en";
    std::vector<std::string> allow_list;
    std::vector<std::string> preserve_entities;
    std::optional<int64_t> slug_length;            // validated to 1..64
    int64_t batch_size = static_cast<int64_t>(kDefaultBatchSize);
    double score_threshold = kDefaultScoreThreshold;
};

struct SecretConfig {
    std::string env_var = "ANON_SECRET_KEY";
};

struct RegistryConfig {
    std::string backend = "sqlite";
    std::string path = "db/entities.db";           // sqlite
    std::string connection_string;                 // postgresql
};

struct OutputConfig {
    std::string directory = "output";
    std::string report_directory = "logs";
};

struct OcrConfig {
    bool enabled = true;
    std::string language = "eng";
    std::string tessdata_path;                     // empty = tesseract default
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                              // empty = stderr only
};

// ============================================================================
// AnonymizerConfig - Complete parsed configuration
// ============================================================================

struct AnonymizerConfig {
    AnonymizationSection anonymization;
    SecretConfig secret;
    RegistryConfig registry;
    OutputConfig output;
    OcrConfig ocr;
    LoggingConfig logging;
    std::vector<CustomRecognizer> recognizers;

    /**
     * @brief Orchestrator settings; preserve types upper-cased
     */
    [[nodiscard]] AnonymizationConfig to_anonymization_config() const;
};

} // namespace docanon

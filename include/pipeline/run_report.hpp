#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace docanon {

/**
 * @brief Per-run performance and entity summary
 */
struct RunReport {
    std::string processed_file;
    std::string output_file;
    std::string generated_at;
    double elapsed_seconds = 0.0;
    uint64_t total_entities_processed = 0;
    std::map<std::string, uint64_t> entities_by_type;

    [[nodiscard]] static RunReport from_counters(const std::filesystem::path& input,
                                                 const std::filesystem::path& output,
                                                 double elapsed_seconds,
                                                 const RunCounters& counters);

    /**
     * @brief "--- Anonymization Stats ---" block printed after a single-file run
     */
    [[nodiscard]] std::string stats_text() const;

    /**
     * @brief Body of report_<file>.txt
     */
    [[nodiscard]] std::string to_text() const;

    /**
     * @throws std::runtime_error if serialization fails
     */
    [[nodiscard]] std::string to_json() const;

    /**
     * @brief Write report_<basename>.txt and report_<basename>.json into `dir`
     * @return path of the text report
     * @throws std::runtime_error on I/O failure
     */
    std::filesystem::path write(const std::filesystem::path& dir) const;
};

} // namespace docanon

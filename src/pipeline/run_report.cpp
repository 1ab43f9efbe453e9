#include "pipeline/run_report.hpp"
#include "pipeline/file_processor.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <format>
#include <stdexcept>

namespace docanon {

RunReport RunReport::from_counters(const std::filesystem::path& input,
                                   const std::filesystem::path& output,
                                   double elapsed_seconds,
                                   const RunCounters& counters) {
    RunReport report;
    report.processed_file = input.string();
    report.output_file = output.string();
    report.generated_at = utils::format_timestamp(utils::now());
    report.elapsed_seconds = elapsed_seconds;
    report.total_entities_processed = counters.total_entities_processed;
    report.entities_by_type = counters.entity_counts;
    return report;
}

std::string RunReport::stats_text() const {
    std::string out = "\n--- Anonymization Stats ---\n";
    out += std::format("Total entities processed: {}\n", total_entities_processed);
    if (!entities_by_type.empty()) {
        out += "Entities by type:\n";
        for (const auto& [type, count] : entities_by_type) {
            out += std::format("  - {}: {}\n", type, count);
        }
    }
    out += "---------------------------\n";
    return out;
}

std::string RunReport::to_text() const {
    std::string out;
    out += std::format("Processed file: {}\n", processed_file);
    out += std::format("Total elapsed time: {:.2f} seconds\n", elapsed_seconds);
    out += std::format("Total entities processed: {}\n", total_entities_processed);
    for (const auto& [type, count] : entities_by_type) {
        out += std::format("  - {}: {}\n", type, count);
    }
    return out;
}

std::string RunReport::to_json() const {
    std::string buffer;
    auto ec = glz::write<glz::opts{.prettify = true, .indentation_width = 4}>(*this, buffer);
    if (ec) {
        throw std::runtime_error("Run report serialization failed");
    }
    return buffer;
}

std::filesystem::path RunReport::write(const std::filesystem::path& dir) const {
    const auto base = std::filesystem::path(processed_file).filename().string();
    const auto text_path = dir / std::format("report_{}.txt", base);
    write_file_bytes(text_path, to_text());
    write_file_bytes(dir / std::format("report_{}.json", base), to_json());
    return text_path;
}

} // namespace docanon

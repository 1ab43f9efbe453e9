#pragma once

#include "core/error.hpp"
#include "format/format_registry.hpp"
#include "pipeline/document_pipeline.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace docanon {

struct DirectorySummary {
    size_t processed = 0;
    size_t skipped = 0;     // unsupported extension
    size_t failed = 0;      // any other error
    std::vector<std::filesystem::path> outputs;
};

/**
 * @brief Files in, anonymized files out
 *
 * Output naming: `<output_dir>/anon_<stem><ext>` where `ext` is the
 * adapter's output extension. The output directory is created on demand.
 */
class FileProcessor {
public:
    FileProcessor(Orchestrator& orchestrator, IOcrExtractor& ocr,
                  std::filesystem::path output_dir, size_t batch_size = kDefaultBatchSize);

    [[nodiscard]] static std::filesystem::path output_path_for(
        const std::filesystem::path& input,
        const std::filesystem::path& output_dir,
        std::string_view extension);

    /**
     * @return path of the written output
     * @throws UnsupportedFormatError for an unknown extension
     * @throws DocumentError if the document cannot be parsed or rebuilt
     * @throws std::runtime_error on I/O failure
     */
    std::filesystem::path process_file(const std::filesystem::path& input);

    /**
     * @brief process_file() with the failure classified instead of thrown
     */
    [[nodiscard]] Result<std::filesystem::path> try_process_file(const std::filesystem::path& input);

    /**
     * @brief Recursive walk; one file's failure never stops the others
     */
    DirectorySummary process_directory(const std::filesystem::path& dir);

private:
    DocumentPipeline pipeline_;
    IOcrExtractor& ocr_;
    std::filesystem::path output_dir_;
};

/**
 * @throws std::runtime_error if the file cannot be read
 */
[[nodiscard]] std::string read_file_bytes(const std::filesystem::path& path);

/**
 * @brief Write (truncate) a file, creating parent directories
 * @throws std::runtime_error on failure
 */
void write_file_bytes(const std::filesystem::path& path, const std::string& bytes);

} // namespace docanon

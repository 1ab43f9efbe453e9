#include "pipeline/file_processor.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace docanon {

std::string read_file_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(std::format("Cannot open file: {}", path.string()));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error(std::format("Error reading file: {}", path.string()));
    }
    return bytes;
}

void write_file_bytes(const std::filesystem::path& path, const std::string& bytes) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(std::format("Cannot create file: {}", path.string()));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error(std::format("Error writing file: {}", path.string()));
    }
}

FileProcessor::FileProcessor(Orchestrator& orchestrator, IOcrExtractor& ocr,
                             std::filesystem::path output_dir, size_t batch_size)
    : pipeline_(orchestrator, batch_size),
      ocr_(ocr),
      output_dir_(std::move(output_dir)) {}

std::filesystem::path FileProcessor::output_path_for(const std::filesystem::path& input,
                                                     const std::filesystem::path& output_dir,
                                                     std::string_view extension) {
    return output_dir / std::format("anon_{}{}", input.stem().string(), extension);
}

std::filesystem::path FileProcessor::process_file(const std::filesystem::path& input) {
    const auto format = format_for_path(input);
    auto adapter = create_adapter(format, ocr_);

    utils::log::debug(std::format("Processing {} as {}", input.string(), document_format_to_string(format)));
    const auto document = read_file_bytes(input);
    const auto output = pipeline_.process(*adapter, document);

    const auto output_path = output_path_for(input, output_dir_, adapter->output_extension());
    write_file_bytes(output_path, output);
    return output_path;
}

Result<std::filesystem::path> FileProcessor::try_process_file(const std::filesystem::path& input) {
    using R = Result<std::filesystem::path>;
    try {
        return R::ok(process_file(input));
    } catch (const UnsupportedFormatError& e) {
        return R::error(ErrorCategory::UNSUPPORTED_FORMAT, e.what());
    } catch (const DocumentError& e) {
        return R::error(ErrorCategory::PARSE_ERROR, e.what());
    } catch (const RegistryError& e) {
        return R::error(ErrorCategory::REGISTRY_ERROR, e.what());
    } catch (const ConfigurationError& e) {
        return R::error(ErrorCategory::CONFIG_ERROR, e.what());
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}

DirectorySummary FileProcessor::process_directory(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    DirectorySummary summary;
    for (const auto& file : files) {
        auto result = try_process_file(file);
        if (result.is_ok()) {
            utils::log::info(std::format("Anonymized file saved at: {}", result.value().string()));
            summary.outputs.push_back(std::move(result.value()));
            ++summary.processed;
        } else if (result.error_category() == ErrorCategory::UNSUPPORTED_FORMAT) {
            utils::log::warn(std::format("Skipping file '{}': {}", file.string(), result.error_message()));
            ++summary.skipped;
        } else {
            utils::log::error(std::format("An error occurred processing file '{}' ({}): {}",
                file.string(), error_category_to_string(result.error_category()), result.error_message()));
            ++summary.failed;
        }
    }

    utils::log::info(std::format("Directory {}: {} processed, {} skipped, {} failed",
        dir.string(), summary.processed, summary.skipped, summary.failed));
    if (summary.processed == 0) {
        utils::log::warn("No files were processed in the directory.");
    }
    return summary;
}

} // namespace docanon

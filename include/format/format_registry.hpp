#pragma once

#include "format/iformat_adapter.hpp"
#include "ocr/iocr_extractor.hpp"

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace docanon {

enum class DocumentFormat {
    TEXT,
    CSV,
    XML,
    JSON,
    PDF,
    DOCX,
    XLSX,
    IMAGE
};

[[nodiscard]] std::string_view document_format_to_string(DocumentFormat format);

/**
 * @brief Format selected by file extension (case-insensitive)
 * @throws UnsupportedFormatError for any other extension
 */
[[nodiscard]] DocumentFormat format_for_path(const std::filesystem::path& path);

/**
 * @brief Every extension format_for_path() accepts, dot included
 */
[[nodiscard]] const std::vector<std::string_view>& supported_extensions();

/**
 * @brief Fresh adapter for one document
 *
 * Formats that embed raster content (PDF, DOCX, XLSX, IMAGE) keep a reference
 * to `ocr`, which must outlive the adapter.
 */
[[nodiscard]] std::unique_ptr<IFormatAdapter> create_adapter(DocumentFormat format, IOcrExtractor& ocr);

} // namespace docanon

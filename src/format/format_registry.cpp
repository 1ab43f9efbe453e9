#include "format/format_registry.hpp"
#include "format/csv_adapter.hpp"
#include "format/docx_adapter.hpp"
#include "format/image_adapter.hpp"
#include "format/json_adapter.hpp"
#include "format/pdf_adapter.hpp"
#include "format/text_adapter.hpp"
#include "format/xlsx_adapter.hpp"
#include "format/xml_adapter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace docanon {

namespace {

const std::unordered_map<std::string_view, DocumentFormat>& extension_table() {
    static const std::unordered_map<std::string_view, DocumentFormat> table = {
        {".txt",  DocumentFormat::TEXT},
        {".csv",  DocumentFormat::CSV},
        {".xml",  DocumentFormat::XML},
        {".json", DocumentFormat::JSON},
        {".pdf",  DocumentFormat::PDF},
        {".docx", DocumentFormat::DOCX},
        {".xlsx", DocumentFormat::XLSX},
        {".jpeg", DocumentFormat::IMAGE},
        {".jpg",  DocumentFormat::IMAGE},
        {".png",  DocumentFormat::IMAGE},
        {".gif",  DocumentFormat::IMAGE},
        {".bmp",  DocumentFormat::IMAGE},
        {".tiff", DocumentFormat::IMAGE},
        {".tif",  DocumentFormat::IMAGE},
        {".webp", DocumentFormat::IMAGE},
        {".jp2",  DocumentFormat::IMAGE},
        {".pnm",  DocumentFormat::IMAGE},
    };
    return table;
}

} // anonymous namespace

std::string_view document_format_to_string(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::TEXT:  return "text";
        case DocumentFormat::CSV:   return "csv";
        case DocumentFormat::XML:   return "xml";
        case DocumentFormat::JSON:  return "json";
        case DocumentFormat::PDF:   return "pdf";
        case DocumentFormat::DOCX:  return "docx";
        case DocumentFormat::XLSX:  return "xlsx";
        case DocumentFormat::IMAGE: return "image";
        default: return "unknown";
    }
}

DocumentFormat format_for_path(const std::filesystem::path& path) {
    const auto ext = utils::to_lower(path.extension().string());
    const auto& table = extension_table();
    if (const auto it = table.find(ext); it != table.end()) {
        return it->second;
    }
    throw UnsupportedFormatError(std::format("Unsupported file type: {}",
        ext.empty() ? path.filename().string() : ext));
}

const std::vector<std::string_view>& supported_extensions() {
    static const std::vector<std::string_view> extensions = [] {
        std::vector<std::string_view> out;
        for (const auto& [ext, format] : extension_table()) out.push_back(ext);
        std::sort(out.begin(), out.end());
        return out;
    }();
    return extensions;
}

std::unique_ptr<IFormatAdapter> create_adapter(DocumentFormat format, IOcrExtractor& ocr) {
    switch (format) {
        case DocumentFormat::TEXT:  return std::make_unique<TextAdapter>();
        case DocumentFormat::CSV:   return std::make_unique<CsvAdapter>();
        case DocumentFormat::XML:   return std::make_unique<XmlAdapter>();
        case DocumentFormat::JSON:  return std::make_unique<JsonAdapter>();
        case DocumentFormat::PDF:   return std::make_unique<PdfAdapter>(ocr);
        case DocumentFormat::DOCX:  return std::make_unique<DocxAdapter>(ocr);
        case DocumentFormat::XLSX:  return std::make_unique<XlsxAdapter>(ocr);
        case DocumentFormat::IMAGE: return std::make_unique<ImageAdapter>(ocr);
    }
    throw UnsupportedFormatError(std::format("No adapter for format {}",
        static_cast<int>(format)));
}

} // namespace docanon

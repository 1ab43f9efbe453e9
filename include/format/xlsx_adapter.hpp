#pragma once

#include "format/iformat_adapter.hpp"
#include "ocr/iocr_extractor.hpp"

#include <memory>
#include <set>

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
}

namespace docanon {

class ZipReader;

/**
 * @brief Workbook package: one unit per non-empty string cell, plus image OCR
 *
 * String cells live either in the shared-string table or inline; both are
 * rewritten in place so formulas, styles and numeric cells are untouched.
 *
 * Pictures anchored on a sheet are OCR'd. Non-blank OCR text is appended
 * below the sheet's last row as ("Anonymized image text:", text). The
 * drawings holding those pictures are removed from the output workbook
 * together with their media parts.
 */
class XlsxAdapter : public IFormatAdapter {
public:
    explicit XlsxAdapter(IOcrExtractor& ocr);
    ~XlsxAdapter() override;

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".xlsx"; }

    static constexpr const char* kImageTextLabel = "Anonymized image text:";

private:
    struct Sheet {
        std::string part;
        std::unique_ptr<tinyxml2::XMLDocument> doc;
        std::vector<tinyxml2::XMLElement*> inline_cells;  // <is> elements
        size_t max_row = 0;
        std::string drawing_rel_id;                       // set when the drawing is dropped
        std::vector<std::string> image_texts;             // non-blank OCR results
    };

    void load_shared_strings(const std::string& workbook_part);
    void load_sheet(size_t index, const std::string& part, std::vector<StructuralUnit>& units);
    void load_drawing(size_t index, Sheet& sheet, const std::string& drawing_part,
                      std::vector<StructuralUnit>& units);

    std::string rewrite_shared_strings(const TranslationMap& mapping) const;
    std::string rewrite_sheet(Sheet& sheet, const TranslationMap& mapping);
    std::string rewrite_sheet_rels(const Sheet& sheet) const;
    std::string rewrite_content_types() const;

    IOcrExtractor& ocr_;
    std::unique_ptr<ZipReader> zip_;
    std::string shared_strings_part_;
    std::vector<std::string> shared_strings_;
    std::vector<Sheet> sheets_;
    std::set<std::string> dropped_parts_;
    bool extracted_ = false;
};

} // namespace docanon

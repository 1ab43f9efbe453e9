#pragma once

#include "format/iformat_adapter.hpp"
#include "format/pdf_reader.hpp"
#include "ocr/iocr_extractor.hpp"

namespace docanon {

/**
 * @brief Paginated document: text blocks and image OCR text in reading order
 *
 * Lines are grouped into blocks: a line joins the block whose last line
 * sits at most one line height above it on the same page and overlaps it
 * horizontally. A block's lines are joined with single spaces, so an entity
 * wrapped across lines reaches the detector whole. Per page, blocks and
 * images are ordered top-to-bottom then left-to-right; each is one unit.
 * Output is the flattened text stream with empty parts omitted.
 */
class PdfAdapter : public IFormatAdapter {
public:
    explicit PdfAdapter(IOcrExtractor& ocr) : ocr_(ocr) {}

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".txt"; }

    /**
     * @brief Order already-read items and OCR the images
     *
     * extract() is PdfReader::read() followed by this.
     */
    [[nodiscard]] std::vector<StructuralUnit> extract_items(std::vector<PdfItem> items);

    /**
     * @brief Merge text lines into blocks; images pass through unchanged
     * @return blocks and images in reading order
     */
    [[nodiscard]] static std::vector<PdfItem> group_blocks(std::vector<PdfItem> items);

private:
    IOcrExtractor& ocr_;
    std::vector<std::string> parts_;
    bool extracted_ = false;
};

} // namespace docanon

#pragma once

#include "format/iformat_adapter.hpp"
#include "ocr/iocr_extractor.hpp"

namespace docanon {

/**
 * @brief Rich-text package: one unit per text run, inline images OCR'd in place
 *
 * Paragraphs are visited in body order, including paragraphs inside tables
 * and content controls. Runs inside hyperlinks and tracked insertions count;
 * deleted text does not. A run holding a drawing contributes the OCR text of
 * each embedded picture instead of its own text.
 *
 * Output is flattened text: one line per non-empty paragraph.
 */
class DocxAdapter : public IFormatAdapter {
public:
    explicit DocxAdapter(IOcrExtractor& ocr) : ocr_(ocr) {}

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".txt"; }

private:
    struct Piece {
        size_t paragraph = 0;
        std::string text;
    };

    IOcrExtractor& ocr_;
    std::vector<Piece> pieces_;
    size_t paragraph_count_ = 0;
    bool extracted_ = false;
};

} // namespace docanon

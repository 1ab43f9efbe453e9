#pragma once

#include "format/iformat_adapter.hpp"
#include "ocr/iocr_extractor.hpp"

namespace docanon {

/**
 * @brief Standalone raster image: its OCR text is the single unit
 */
class ImageAdapter : public IFormatAdapter {
public:
    explicit ImageAdapter(IOcrExtractor& ocr) : ocr_(ocr) {}

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".txt"; }

private:
    IOcrExtractor& ocr_;
    std::string text_;
    bool extracted_ = false;
};

} // namespace docanon

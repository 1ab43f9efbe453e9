#pragma once

#include "ocr/iocr_extractor.hpp"
#include <memory>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace docanon {

/**
 * @brief Tesseract + Leptonica OCR
 *
 * The engine is initialized once; if initialization fails (missing
 * traineddata, bad tessdata path) every extract() returns "" and a warning
 * is logged once.
 */
class TesseractOcrExtractor : public IOcrExtractor {
public:
    /**
     * @param language Tesseract language code(s), e.g. "eng" or "eng+por"
     * @param tessdata_path Directory holding *.traineddata; empty = Tesseract default
     */
    explicit TesseractOcrExtractor(const std::string& language = "eng",
                                   const std::string& tessdata_path = "");
    ~TesseractOcrExtractor() override;

    TesseractOcrExtractor(const TesseractOcrExtractor&) = delete;
    TesseractOcrExtractor& operator=(const TesseractOcrExtractor&) = delete;

    std::string extract(const std::vector<uint8_t>& image_bytes) noexcept override;

    [[nodiscard]] bool is_available() const { return api_ != nullptr; }

private:
    std::unique_ptr<tesseract::TessBaseAPI> api_;
};

} // namespace docanon

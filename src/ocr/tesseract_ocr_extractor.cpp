#include "ocr/tesseract_ocr_extractor.hpp"
#include "core/utils.hpp"

#include <tesseract/baseapi.h>
#include <leptonica/allheaders.h>

#include <format>

namespace docanon {

TesseractOcrExtractor::TesseractOcrExtractor(const std::string& language,
                                             const std::string& tessdata_path) {
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api->Init(datapath, language.c_str()) != 0) {
        utils::log::warn(std::format(
            "OCR unavailable: could not initialize tesseract for '{}'; image text will be empty",
            language));
        return;
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    api_ = std::move(api);
}

TesseractOcrExtractor::~TesseractOcrExtractor() {
    if (api_) {
        api_->End();
    }
}

std::string TesseractOcrExtractor::extract(const std::vector<uint8_t>& image_bytes) noexcept {
    if (!api_ || image_bytes.empty()) return {};

    try {
        Pix* image = pixReadMem(image_bytes.data(), image_bytes.size());
        if (!image) {
            utils::log::debug(std::format("OCR: could not decode {}-byte image", image_bytes.size()));
            return {};
        }

        api_->SetImage(image);
        char* raw = api_->GetUTF8Text();
        std::string text = raw ? raw : "";
        delete[] raw;

        api_->Clear();
        pixDestroy(&image);
        return text;
    } catch (const std::exception& e) {
        utils::log::warn(std::format("OCR failed: {}", e.what()));
        return {};
    }
}

} // namespace docanon

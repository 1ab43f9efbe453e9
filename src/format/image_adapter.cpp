#include "format/image_adapter.hpp"
#include "core/error.hpp"

namespace docanon {

std::vector<StructuralUnit> ImageAdapter::extract(const std::string& document) {
    text_ = ocr_.extract(std::vector<uint8_t>(document.begin(), document.end()));
    extracted_ = true;
    return {StructuralUnit(text_, UnitPosition::image_text(0, 0))};
}

std::string ImageAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("image: reconstruct() called before extract()");
    return translate(mapping, text_);
}

} // namespace docanon

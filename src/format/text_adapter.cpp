#include "format/text_adapter.hpp"
#include "core/error.hpp"

namespace docanon {

std::vector<StructuralUnit> TextAdapter::extract(const std::string& document) {
    content_ = document;
    extracted_ = true;
    return {StructuralUnit(content_, UnitPosition::char_range(0, content_.size()))};
}

std::string TextAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("text: reconstruct() called before extract()");
    return translate(mapping, content_);
}

} // namespace docanon

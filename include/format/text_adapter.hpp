#pragma once

#include "format/iformat_adapter.hpp"

namespace docanon {

/**
 * @brief Flat text: the whole content is one unit
 */
class TextAdapter : public IFormatAdapter {
public:
    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".txt"; }

private:
    std::string content_;
    bool extracted_ = false;
};

} // namespace docanon

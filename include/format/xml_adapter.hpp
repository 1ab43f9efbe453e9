#pragma once

#include "format/iformat_adapter.hpp"

#include <memory>

namespace tinyxml2 {
class XMLDocument;
class XMLText;
}

namespace docanon {

/**
 * @brief Tree markup: one unit per non-blank text node
 *
 * Element text and tail segments are both text nodes in document order.
 * CDATA sections count as text; comments and processing instructions are
 * left alone. Whitespace is preserved. The output always starts with an
 * XML declaration.
 */
class XmlAdapter : public IFormatAdapter {
public:
    XmlAdapter();
    ~XmlAdapter() override;

    std::vector<StructuralUnit> extract(const std::string& document) override;
    std::string reconstruct(const TranslationMap& mapping) override;
    std::string_view output_extension() const override { return ".xml"; }

private:
    std::unique_ptr<tinyxml2::XMLDocument> doc_;
    std::vector<tinyxml2::XMLText*> text_nodes_;
    bool extracted_ = false;
};

} // namespace docanon

#include "format/xml_adapter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <tinyxml2.h>

#include <format>

namespace docanon {

namespace {

void collect_text_nodes(tinyxml2::XMLNode* node, const std::string& path,
                        std::vector<tinyxml2::XMLText*>& nodes,
                        std::vector<StructuralUnit>& units) {
    for (auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (auto* text = child->ToText()) {
            const char* value = text->Value();
            if (value && !utils::is_blank(value)) {
                units.emplace_back(value, UnitPosition::tree_node(nodes.size(), path));
                nodes.push_back(text);
            }
        } else if (auto* element = child->ToElement()) {
            collect_text_nodes(element, std::format("{}/{}", path, element->Name()), nodes, units);
        }
    }
}

} // anonymous namespace

XmlAdapter::XmlAdapter() = default;
XmlAdapter::~XmlAdapter() = default;

std::vector<StructuralUnit> XmlAdapter::extract(const std::string& document) {
    doc_ = std::make_unique<tinyxml2::XMLDocument>(true, tinyxml2::PRESERVE_WHITESPACE);
    text_nodes_.clear();

    if (doc_->Parse(document.c_str(), document.size()) != tinyxml2::XML_SUCCESS) {
        throw DocumentError(std::format("xml: {} (line {})",
            doc_->ErrorStr(), doc_->ErrorLineNum()));
    }
    extracted_ = true;

    std::vector<StructuralUnit> units;
    collect_text_nodes(doc_.get(), "", text_nodes_, units);
    return units;
}

std::string XmlAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("xml: reconstruct() called before extract()");

    for (auto* text : text_nodes_) {
        const std::string original = text->Value();
        const auto& replacement = translate(mapping, original);
        if (replacement != original) {
            text->SetValue(replacement.c_str());
        }
    }

    auto* first = doc_->FirstChild();
    if (!first || !first->ToDeclaration()) {
        doc_->InsertFirstChild(doc_->NewDeclaration());
    }

    tinyxml2::XMLPrinter printer(nullptr, true);
    doc_->Print(&printer);
    std::string out(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
    return out;
}

} // namespace docanon

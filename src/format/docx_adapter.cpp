#include "format/docx_adapter.hpp"
#include "format/ooxml.hpp"
#include "format/zip_archive.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <tinyxml2.h>

#include <format>

namespace docanon {

namespace {

constexpr const char* kDefaultMainPart = "word/document.xml";

/**
 * @brief Walks document.xml and emits runs/images per paragraph
 */
class BodyWalker {
public:
    BodyWalker(const ZipReader& zip, const std::string& main_part,
               const ooxml::Relationships& rels, IOcrExtractor& ocr)
        : zip_(zip), main_part_(main_part), rels_(rels), ocr_(ocr) {}

    void walk_blocks(const tinyxml2::XMLElement* parent) {
        for (auto* el = parent->FirstChildElement(); el; el = el->NextSiblingElement()) {
            const auto name = ooxml::local_name(el);
            if (name == "p") {
                walk_paragraph(el);
            } else if (name == "tbl" || name == "tr" || name == "tc" ||
                       name == "sdt" || name == "sdtContent" || name == "customXml") {
                walk_blocks(el);
            }
        }
    }

    std::vector<StructuralUnit> units;
    std::vector<std::pair<size_t, std::string>> pieces;
    size_t paragraphs = 0;
    size_t images = 0;

private:
    void walk_paragraph(const tinyxml2::XMLElement* paragraph) {
        const size_t index = paragraphs++;
        size_t run_index = 0;
        walk_inline(paragraph, index, run_index);
    }

    void walk_inline(const tinyxml2::XMLElement* parent, size_t paragraph, size_t& run_index) {
        for (auto* el = parent->FirstChildElement(); el; el = el->NextSiblingElement()) {
            const auto name = ooxml::local_name(el);
            if (name == "r") {
                walk_run(el, paragraph, run_index++);
            } else if (name == "hyperlink" || name == "ins" || name == "smartTag" ||
                       name == "fldSimple" || name == "sdt" || name == "sdtContent") {
                walk_inline(el, paragraph, run_index);
            }
        }
    }

    void walk_run(const tinyxml2::XMLElement* run, size_t paragraph, size_t run_index) {
        std::vector<std::string> embeds;
        collect_embeds(run, embeds);

        bool has_drawing = false;
        for (auto* el = run->FirstChildElement(); el; el = el->NextSiblingElement()) {
            const auto name = ooxml::local_name(el);
            if (name == "drawing" || name == "pict" || name == "object") has_drawing = true;
        }

        if (has_drawing) {
            for (const auto& id : embeds) {
                auto text = ocr_image(id);
                units.emplace_back(text, UnitPosition::image_text(paragraph, images++));
                pieces.emplace_back(paragraph, std::move(text));
            }
            return;
        }

        auto text = run_text(run);
        if (text.empty()) return;
        units.emplace_back(text, UnitPosition::run(paragraph, run_index));
        pieces.emplace_back(paragraph, std::move(text));
    }

    static std::string run_text(const tinyxml2::XMLElement* run) {
        std::string out;
        for (auto* el = run->FirstChildElement(); el; el = el->NextSiblingElement()) {
            const auto name = ooxml::local_name(el);
            if (name == "t") {
                if (const char* text = el->GetText()) out += text;
            } else if (name == "tab") {
                out += '\t';
            } else if (name == "br" || name == "cr") {
                out += '\n';
            }
        }
        return out;
    }

    static void collect_embeds(const tinyxml2::XMLElement* el, std::vector<std::string>& out) {
        for (auto* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            const auto name = ooxml::local_name(child);
            if (name == "blip") {
                if (const char* id = child->Attribute("r:embed")) out.emplace_back(id);
            } else if (name == "imagedata") {
                if (const char* id = child->Attribute("r:id")) out.emplace_back(id);
            }
            collect_embeds(child, out);
        }
    }

    std::string ocr_image(const std::string& rel_id) {
        const auto it = rels_.find(rel_id);
        if (it == rels_.end() || it->second.external || !ooxml::has_type(it->second, "image")) {
            utils::log::debug(std::format("docx: image relationship '{}' not embedded", rel_id));
            return {};
        }
        const auto bytes = zip_.read(ooxml::resolve_part_path(main_part_, it->second.target));
        if (!bytes) return {};
        return ocr_.extract(std::vector<uint8_t>(bytes->begin(), bytes->end()));
    }

    const ZipReader& zip_;
    const std::string& main_part_;
    const ooxml::Relationships& rels_;
    IOcrExtractor& ocr_;
};

} // anonymous namespace

std::vector<StructuralUnit> DocxAdapter::extract(const std::string& document) {
    const ZipReader zip(document);
    const auto main_part = ooxml::office_document_part(
        zip.read("_rels/.rels").value_or(""), kDefaultMainPart);

    const auto xml = zip.read(main_part);
    if (!xml) {
        throw DocumentError(std::format("docx: missing main part '{}'", main_part));
    }

    tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
    if (doc.Parse(xml->c_str(), xml->size()) != tinyxml2::XML_SUCCESS) {
        throw DocumentError(std::format("docx: {} in '{}'", doc.ErrorStr(), main_part));
    }

    const auto* root = doc.RootElement();
    const tinyxml2::XMLElement* body = nullptr;
    for (auto* el = root ? root->FirstChildElement() : nullptr; el; el = el->NextSiblingElement()) {
        if (ooxml::local_name(el) == "body") {
            body = el;
            break;
        }
    }
    if (!body) {
        throw DocumentError("docx: document has no body");
    }

    const auto rels_xml = zip.read(ooxml::rels_path_for(main_part));
    const auto rels = ooxml::parse_relationships(rels_xml.value_or(""));

    BodyWalker walker(zip, main_part, rels, ocr_);
    walker.walk_blocks(body);

    pieces_.clear();
    for (auto& [paragraph, text] : walker.pieces) {
        pieces_.push_back({paragraph, std::move(text)});
    }
    paragraph_count_ = walker.paragraphs;
    extracted_ = true;

    utils::log::debug(std::format("docx: {} paragraphs, {} units, {} images",
        walker.paragraphs, walker.units.size(), walker.images));
    return std::move(walker.units);
}

std::string DocxAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("docx: reconstruct() called before extract()");

    std::vector<std::string> paragraphs(paragraph_count_);
    for (const auto& piece : pieces_) {
        paragraphs[piece.paragraph] += translate(mapping, piece.text);
    }

    std::string out;
    for (const auto& para : paragraphs) {
        if (para.empty()) continue;
        if (!out.empty()) out += '\n';
        out += para;
    }
    return out;
}

} // namespace docanon

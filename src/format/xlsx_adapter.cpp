#include "format/xlsx_adapter.hpp"
#include "format/ooxml.hpp"
#include "format/zip_archive.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <format>
#include <unordered_map>

namespace docanon {

namespace {

constexpr const char* kDefaultWorkbookPart = "xl/workbook.xml";
constexpr const char* kContentTypesPart = "[Content_Types].xml";

std::unique_ptr<tinyxml2::XMLDocument> parse_part(const ZipReader& zip, const std::string& part) {
    const auto xml = zip.read(part);
    if (!xml) {
        throw DocumentError(std::format("xlsx: missing part '{}'", part));
    }
    auto doc = std::make_unique<tinyxml2::XMLDocument>(true, tinyxml2::PRESERVE_WHITESPACE);
    if (doc->Parse(xml->c_str(), xml->size()) != tinyxml2::XML_SUCCESS) {
        throw DocumentError(std::format("xlsx: {} in '{}'", doc->ErrorStr(), part));
    }
    return doc;
}

std::string print(const tinyxml2::XMLDocument& doc) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
}

tinyxml2::XMLElement* child_named(tinyxml2::XMLElement* parent, std::string_view name) {
    for (auto* el = parent ? parent->FirstChildElement() : nullptr; el; el = el->NextSiblingElement()) {
        if (ooxml::local_name(el) == name) return el;
    }
    return nullptr;
}

// "x:" for prefixed SpreadsheetML, "" for the default namespace
std::string prefix_of(const tinyxml2::XMLElement* el) {
    const std::string_view name(el->Name());
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? std::string{} : std::string(name.substr(0, colon + 1));
}

/**
 * @brief Text of an <si> or <is> item: plain <t> plus rich-text runs, minus phonetic hints
 */
std::string string_item_text(const tinyxml2::XMLElement* item) {
    std::string out;
    for (auto* el = item->FirstChildElement(); el; el = el->NextSiblingElement()) {
        const auto name = ooxml::local_name(el);
        if (name == "t") {
            if (const char* text = el->GetText()) out += text;
        } else if (name == "r") {
            out += ooxml::collect_text(el, "t");
        }
    }
    return out;
}

void set_string_item(tinyxml2::XMLElement* item, const std::string& text) {
    auto* doc = item->GetDocument();
    const auto prefix = prefix_of(item);
    item->DeleteChildren();
    auto* t = doc->NewElement((prefix + "t").c_str());
    t->SetAttribute("xml:space", "preserve");
    t->SetText(text.c_str());
    item->InsertEndChild(t);
}

// "BC12" -> 54 (zero-based column)
std::optional<size_t> column_index(std::string_view ref) {
    size_t col = 0;
    size_t letters = 0;
    for (const char c : ref) {
        if (c >= 'A' && c <= 'Z') {
            col = col * 26 + static_cast<size_t>(c - 'A' + 1);
            ++letters;
        } else {
            break;
        }
    }
    if (letters == 0) return std::nullopt;
    return col - 1;
}

void collect_embeds(const tinyxml2::XMLElement* el, std::vector<std::string>& out) {
    for (auto* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (ooxml::local_name(child) == "blip") {
            if (const char* id = child->Attribute("r:embed")) out.emplace_back(id);
        }
        collect_embeds(child, out);
    }
}

tinyxml2::XMLElement* inline_cell(tinyxml2::XMLDocument& doc, const std::string& prefix,
                                  const std::string& ref, const std::string& text) {
    auto* cell = doc.NewElement((prefix + "c").c_str());
    cell->SetAttribute("r", ref.c_str());
    cell->SetAttribute("t", "inlineStr");
    auto* is = doc.NewElement((prefix + "is").c_str());
    cell->InsertEndChild(is);
    set_string_item(is, text);
    return cell;
}

} // anonymous namespace

XlsxAdapter::XlsxAdapter(IOcrExtractor& ocr) : ocr_(ocr) {}
XlsxAdapter::~XlsxAdapter() = default;

// ============================================================================
// Extraction
// ============================================================================

std::vector<StructuralUnit> XlsxAdapter::extract(const std::string& document) {
    zip_ = std::make_unique<ZipReader>(document);
    shared_strings_part_.clear();
    shared_strings_.clear();
    sheets_.clear();
    dropped_parts_.clear();

    const auto workbook_part = ooxml::office_document_part(
        zip_->read("_rels/.rels").value_or(""), kDefaultWorkbookPart);
    const auto workbook = parse_part(*zip_, workbook_part);
    const auto rels = ooxml::parse_relationships(
        zip_->read(ooxml::rels_path_for(workbook_part)).value_or(""));

    for (const auto& [id, rel] : rels) {
        if (ooxml::has_type(rel, "sharedStrings")) {
            shared_strings_part_ = ooxml::resolve_part_path(workbook_part, rel.target);
        }
    }
    if (!shared_strings_part_.empty()) {
        load_shared_strings(shared_strings_part_);
    }

    std::vector<StructuralUnit> units;
    auto* sheets = child_named(workbook->RootElement(), "sheets");
    for (auto* el = sheets ? sheets->FirstChildElement() : nullptr; el; el = el->NextSiblingElement()) {
        const char* rel_id = el->Attribute("r:id");
        if (!rel_id) continue;
        const auto it = rels.find(rel_id);
        if (it == rels.end() || !ooxml::has_type(it->second, "worksheet")) continue;
        load_sheet(sheets_.size(), ooxml::resolve_part_path(workbook_part, it->second.target), units);
    }

    extracted_ = true;
    utils::log::debug(std::format("xlsx: {} sheets, {} shared strings, {} units",
        sheets_.size(), shared_strings_.size(), units.size()));
    return units;
}

void XlsxAdapter::load_shared_strings(const std::string& part) {
    const auto doc = parse_part(*zip_, part);
    for (auto* si = doc->RootElement()->FirstChildElement(); si; si = si->NextSiblingElement()) {
        if (ooxml::local_name(si) == "si") {
            shared_strings_.push_back(string_item_text(si));
        }
    }
}

void XlsxAdapter::load_sheet(size_t index, const std::string& part, std::vector<StructuralUnit>& units) {
    Sheet sheet;
    sheet.part = part;
    sheet.doc = parse_part(*zip_, part);
    auto* root = sheet.doc->RootElement();

    size_t row_num = 0;
    auto* data = child_named(root, "sheetData");
    for (auto* row = data ? data->FirstChildElement() : nullptr; row; row = row->NextSiblingElement()) {
        if (ooxml::local_name(row) != "row") continue;
        row_num = row->UnsignedAttribute("r", static_cast<unsigned>(row_num + 1));
        sheet.max_row = std::max(sheet.max_row, row_num);

        size_t col = 0;
        for (auto* c = row->FirstChildElement(); c; c = c->NextSiblingElement()) {
            if (ooxml::local_name(c) != "c") continue;
            if (const char* ref = c->Attribute("r")) {
                col = column_index(ref).value_or(col);
            }

            const std::string_view type = c->Attribute("t") ? c->Attribute("t") : "";
            std::string text;
            if (type == "s") {
                auto* v = child_named(c, "v");
                const auto idx = utils::try_parse_int<size_t>(v && v->GetText() ? v->GetText() : "");
                if (idx && *idx < shared_strings_.size()) text = shared_strings_[*idx];
            } else if (type == "inlineStr") {
                if (auto* is = child_named(c, "is")) {
                    text = string_item_text(is);
                    sheet.inline_cells.push_back(is);
                }
            }

            if (!text.empty()) {
                units.emplace_back(std::move(text), UnitPosition::cell(index, row_num - 1, col));
            }
            ++col;
        }
    }

    if (auto* drawing = child_named(root, "drawing")) {
        const auto sheet_rels = ooxml::parse_relationships(
            zip_->read(ooxml::rels_path_for(part)).value_or(""));
        const char* rel_id = drawing->Attribute("r:id");
        const auto it = rel_id ? sheet_rels.find(rel_id) : sheet_rels.end();
        if (it != sheet_rels.end() && !it->second.external) {
            const auto drawing_part = ooxml::resolve_part_path(part, it->second.target);
            load_drawing(index, sheet, drawing_part, units);
            if (dropped_parts_.contains(drawing_part)) {
                sheet.drawing_rel_id = rel_id;
            }
        }
    }

    sheets_.push_back(std::move(sheet));
}

void XlsxAdapter::load_drawing(size_t index, Sheet& sheet, const std::string& drawing_part,
                               std::vector<StructuralUnit>& units) {
    const auto xml = zip_->read(drawing_part);
    if (!xml) return;

    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml->c_str(), xml->size()) != tinyxml2::XML_SUCCESS || !doc.RootElement()) {
        utils::log::warn(std::format("xlsx: unreadable drawing '{}' left in place", drawing_part));
        return;
    }

    std::vector<std::string> embeds;
    collect_embeds(doc.RootElement(), embeds);
    if (embeds.empty()) return;

    const auto rels_part = ooxml::rels_path_for(drawing_part);
    const auto rels = ooxml::parse_relationships(zip_->read(rels_part).value_or(""));

    for (const auto& id : embeds) {
        const auto it = rels.find(id);
        if (it == rels.end() || it->second.external) continue;

        const auto media_part = ooxml::resolve_part_path(drawing_part, it->second.target);
        dropped_parts_.insert(media_part);

        const auto bytes = zip_->read(media_part);
        if (!bytes) continue;
        auto text = ocr_.extract(std::vector<uint8_t>(bytes->begin(), bytes->end()));
        if (utils::is_blank(text)) continue;

        units.emplace_back(text, UnitPosition::image_text(index, sheet.image_texts.size()));
        sheet.image_texts.push_back(std::move(text));
    }

    dropped_parts_.insert(drawing_part);
    dropped_parts_.insert(rels_part);
}

// ============================================================================
// Reconstruction
// ============================================================================

std::string XlsxAdapter::reconstruct(const TranslationMap& mapping) {
    if (!extracted_) throw DocumentError("xlsx: reconstruct() called before extract()");

    std::unordered_map<std::string, Sheet*> by_part;
    std::unordered_map<std::string, const Sheet*> by_rels;
    for (auto& sheet : sheets_) {
        by_part.emplace(sheet.part, &sheet);
        if (!sheet.drawing_rel_id.empty()) {
            by_rels.emplace(ooxml::rels_path_for(sheet.part), &sheet);
        }
    }

    ZipWriter writer;
    for (const auto& name : zip_->entries()) {
        if (dropped_parts_.contains(name)) continue;

        if (name == shared_strings_part_) {
            writer.add(name, rewrite_shared_strings(mapping));
        } else if (const auto sheet = by_part.find(name); sheet != by_part.end()) {
            writer.add(name, rewrite_sheet(*sheet->second, mapping));
        } else if (const auto rels = by_rels.find(name); rels != by_rels.end()) {
            writer.add(name, rewrite_sheet_rels(*rels->second));
        } else if (name == kContentTypesPart && !dropped_parts_.empty()) {
            writer.add(name, rewrite_content_types());
        } else {
            writer.copy_from(*zip_, name);
        }
    }
    return writer.finish();
}

std::string XlsxAdapter::rewrite_shared_strings(const TranslationMap& mapping) const {
    const auto doc = parse_part(*zip_, shared_strings_part_);
    size_t idx = 0;
    for (auto* si = doc->RootElement()->FirstChildElement(); si; si = si->NextSiblingElement()) {
        if (ooxml::local_name(si) != "si") continue;
        const auto& original = shared_strings_[idx++];
        const auto& replacement = translate(mapping, original);
        if (replacement != original) set_string_item(si, replacement);
    }
    return print(*doc);
}

std::string XlsxAdapter::rewrite_sheet(Sheet& sheet, const TranslationMap& mapping) {
    for (auto* is : sheet.inline_cells) {
        const auto original = string_item_text(is);
        const auto& replacement = translate(mapping, original);
        if (replacement != original) set_string_item(is, replacement);
    }

    auto* root = sheet.doc->RootElement();
    if (!sheet.drawing_rel_id.empty()) {
        if (auto* drawing = child_named(root, "drawing")) root->DeleteChild(drawing);
    }

    if (!sheet.image_texts.empty()) {
        auto* data = child_named(root, "sheetData");
        if (!data) {
            throw DocumentError(std::format("xlsx: '{}' has no sheetData", sheet.part));
        }
        const auto prefix = prefix_of(data);
        size_t row_num = sheet.max_row;
        for (const auto& text : sheet.image_texts) {
            ++row_num;
            auto* row = sheet.doc->NewElement((prefix + "row").c_str());
            row->SetAttribute("r", static_cast<unsigned>(row_num));
            row->InsertEndChild(inline_cell(*sheet.doc, prefix, std::format("A{}", row_num), kImageTextLabel));
            row->InsertEndChild(inline_cell(*sheet.doc, prefix, std::format("B{}", row_num),
                                            translate(mapping, text)));
            data->InsertEndChild(row);
        }
    }
    return print(*sheet.doc);
}

std::string XlsxAdapter::rewrite_sheet_rels(const Sheet& sheet) const {
    const auto doc = parse_part(*zip_, ooxml::rels_path_for(sheet.part));
    auto* root = doc->RootElement();
    for (auto* el = root->FirstChildElement(); el; el = el->NextSiblingElement()) {
        const char* id = el->Attribute("Id");
        if (id && sheet.drawing_rel_id == id) {
            root->DeleteChild(el);
            break;
        }
    }
    return print(*doc);
}

std::string XlsxAdapter::rewrite_content_types() const {
    const auto doc = parse_part(*zip_, kContentTypesPart);
    auto* root = doc->RootElement();

    std::vector<tinyxml2::XMLElement*> stale;
    for (auto* el = root->FirstChildElement(); el; el = el->NextSiblingElement()) {
        if (ooxml::local_name(el) != "Override") continue;
        const char* part_name = el->Attribute("PartName");
        if (part_name && dropped_parts_.contains(ooxml::resolve_part_path("", part_name))) {
            stale.push_back(el);
        }
    }
    for (auto* el : stale) root->DeleteChild(el);
    return print(*doc);
}

} // namespace docanon

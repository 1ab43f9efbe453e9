#include "format/ooxml.hpp"

#include <tinyxml2.h>

#include <vector>

namespace docanon::ooxml {

namespace {

std::vector<std::string> path_segments(std::string_view path) {
    std::vector<std::string> segments;
    size_t begin = 0;
    while (begin <= path.size()) {
        const auto end = path.find('/', begin);
        const auto seg = path.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
        if (!seg.empty()) segments.emplace_back(seg);
        if (end == std::string_view::npos) break;
        begin = end + 1;
    }
    return segments;
}

} // anonymous namespace

Relationships parse_relationships(const std::string& xml) {
    Relationships rels;
    if (xml.empty()) return rels;

    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) return rels;

    const auto* root = doc.RootElement();
    if (!root) return rels;

    for (auto* el = root->FirstChildElement(); el; el = el->NextSiblingElement()) {
        if (local_name(el) != "Relationship") continue;
        const char* id = el->Attribute("Id");
        if (!id) continue;

        Relationship rel;
        rel.id = id;
        if (const char* type = el->Attribute("Type")) rel.type = type;
        if (const char* target = el->Attribute("Target")) rel.target = target;
        if (const char* mode = el->Attribute("TargetMode")) rel.external = std::string_view(mode) == "External";
        rels.emplace(rel.id, std::move(rel));
    }
    return rels;
}

std::string office_document_part(const std::string& root_rels_xml, const std::string& fallback) {
    for (const auto& [id, rel] : parse_relationships(root_rels_xml)) {
        if (has_type(rel, "officeDocument")) {
            return resolve_part_path("", rel.target);
        }
    }
    return fallback;
}

std::string rels_path_for(const std::string& part) {
    const auto slash = part.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part + ".rels";
    }
    return part.substr(0, slash) + "/_rels/" + part.substr(slash + 1) + ".rels";
}

std::string resolve_part_path(const std::string& owner_part, const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }

    auto segments = path_segments(owner_part);
    if (!segments.empty()) segments.pop_back();  // owner file name

    for (auto& seg : path_segments(target)) {
        if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (seg != ".") {
            segments.push_back(std::move(seg));
        }
    }

    std::string out;
    for (const auto& seg : segments) {
        if (!out.empty()) out += '/';
        out += seg;
    }
    return out;
}

bool has_type(const Relationship& rel, std::string_view short_name) {
    const std::string_view type(rel.type);
    return type.size() > short_name.size() &&
           type.ends_with(short_name) &&
           type[type.size() - short_name.size() - 1] == '/';
}

std::string_view local_name(const tinyxml2::XMLElement* element) {
    const std::string_view name(element->Name());
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string collect_text(const tinyxml2::XMLElement* element, std::string_view text_element) {
    std::string out;
    for (auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (local_name(child) == text_element) {
            if (const char* text = child->GetText()) out += text;
        } else {
            out += collect_text(child, text_element);
        }
    }
    return out;
}

} // namespace docanon::ooxml

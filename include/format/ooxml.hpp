#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace tinyxml2 {
class XMLElement;
}

namespace docanon::ooxml {

/**
 * @brief One <Relationship> of an OPC .rels part
 */
struct Relationship {
    std::string id;
    std::string type;
    std::string target;      // as written in the .rels part
    bool external = false;   // TargetMode="External"
};

using Relationships = std::unordered_map<std::string, Relationship>;

/**
 * @brief Parse a .rels part; malformed or empty input yields an empty map
 */
[[nodiscard]] Relationships parse_relationships(const std::string& xml);

/**
 * @brief Main part named by the package's root _rels/.rels, or `fallback`
 */
[[nodiscard]] std::string office_document_part(const std::string& root_rels_xml,
                                               const std::string& fallback);

/**
 * @brief "xl/worksheets/sheet1.xml" -> "xl/worksheets/_rels/sheet1.xml.rels"
 */
[[nodiscard]] std::string rels_path_for(const std::string& part);

/**
 * @brief Resolve a relationship target ("../media/a.png") against the
 *        directory of the part that owns the relationship
 */
[[nodiscard]] std::string resolve_part_path(const std::string& owner_part, const std::string& target);

/**
 * @brief Relationship type URIs end with a short name (".../image", ".../drawing")
 */
[[nodiscard]] bool has_type(const Relationship& rel, std::string_view short_name);

/**
 * @brief Element name without its namespace prefix ("w:p" -> "p")
 */
[[nodiscard]] std::string_view local_name(const tinyxml2::XMLElement* element);

/**
 * @brief Concatenated text of every descendant whose local name is `text_element`
 */
[[nodiscard]] std::string collect_text(const tinyxml2::XMLElement* element,
                                       std::string_view text_element = "t");

} // namespace docanon::ooxml

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docanon {

/**
 * @brief Language codes accepted by --lang, with display names
 */
[[nodiscard]] inline const std::vector<std::pair<std::string_view, std::string_view>>&
supported_languages() {
    static const std::vector<std::pair<std::string_view, std::string_view>> languages = {
        {"ca", "Catalan"},
        {"zh", "Chinese"},
        {"hr", "Croatian"},
        {"da", "Danish"},
        {"nl", "Dutch"},
        {"en", "English"},
        {"fi", "Finnish"},
        {"fr", "French"},
        {"de", "German"},
        {"el", "Greek"},
        {"it", "Italian"},
        {"ja", "Japanese"},
        {"ko", "Korean"},
        {"lt", "Lithuanian"},
        {"mk", "Macedonian"},
        {"nb", "Norwegian Bokm\xC3\xA5l"},
        {"pl", "Polish"},
        {"pt", "Portuguese"},
        {"ro", "Romanian"},
        {"ru", "Russian"},
        {"sl", "Slovenian"},
        {"es", "Spanish"},
        {"sv", "Swedish"},
        {"uk", "Ukrainian"},
    };
    return languages;
}

[[nodiscard]] inline bool is_supported_language(std::string_view code) {
    for (const auto& [lang, name] : supported_languages()) {
        if (lang == code) return true;
    }
    return false;
}

} // namespace docanon

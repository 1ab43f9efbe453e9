#include "registry/reverse_lookup.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace docanon {

namespace {

constexpr const char* kInvalidFormat =
    "Invalid slug format. Expected format: [ENTITY_TYPE_display_hash].";
constexpr const char* kMissingHash = "Invalid slug format. Display hash not found.";
constexpr const char* kRegistryMissing =
    "Database file not found. Please run the anonymizer first.";
constexpr const char* kNotFound = "Original text not found for the given slug.";

// Unlike utils::split, keeps a trailing empty field ("TYPE_" has two parts)
std::vector<std::string> split_fields(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    size_t begin = 0;
    for (;;) {
        const auto pos = str.find(delimiter, begin);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(begin));
            return fields;
        }
        fields.push_back(str.substr(begin, pos - begin));
        begin = pos + 1;
    }
}

bool is_full_hash(std::string_view hash) {
    return hash.size() == kFullHashLength &&
        std::all_of(hash.begin(), hash.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
}

} // anonymous namespace

ReverseLookup::ReverseLookup(EntityRegistry* registry)
    : registry_(registry) {}

std::optional<ParsedToken> ReverseLookup::parse_token(std::string_view token) {
    const auto parts = split_fields(utils::trim(std::string(token)), '_');
    if (parts.size() < 2) return std::nullopt;

    ParsedToken parsed;
    parsed.entity_type = parts.front();
    parsed.entity_type.erase(0, parsed.entity_type.find_first_not_of('['));

    parsed.display_hash = parts.back();
    while (!parsed.display_hash.empty() && parsed.display_hash.back() == ']') {
        parsed.display_hash.pop_back();
    }
    if (parsed.display_hash.empty()) return std::nullopt;
    return parsed;
}

LookupResult ReverseLookup::lookup(const std::string& token) const {
    LookupResult result;

    if (!registry_) {
        result.status = LookupStatus::REGISTRY_MISSING;
        result.message = kRegistryMissing;
        return result;
    }

    const auto parsed = parse_token(token);
    if (!parsed) {
        result.status = LookupStatus::INVALID_TOKEN;
        result.message = split_fields(utils::trim(token), '_').size() < 2 ? kInvalidFormat : kMissingHash;
        return result;
    }

    try {
        result.record = registry_->find_by_display_hash(parsed->display_hash);
        if (!result.record && is_full_hash(parsed->display_hash)) {
            // A full-length body may come from a run with a shorter slug_length
            result.record = registry_->find_by_full_hash(parsed->display_hash);
        }
    } catch (const std::exception& e) {
        result.status = LookupStatus::REGISTRY_ERROR;
        result.message = std::format("Database error: {}", e.what());
        return result;
    }

    if (!result.record) {
        result.status = LookupStatus::NOT_FOUND;
        result.message = kNotFound;
        return result;
    }

    if (result.record->entity_type != parsed->entity_type) {
        utils::log::debug(std::format("Token type '{}' differs from stored type '{}'",
            parsed->entity_type, result.record->entity_type));
    }

    result.status = LookupStatus::FOUND;
    return result;
}

std::string ReverseLookup::format_result(const LookupResult& result) {
    if (!result.found()) return result.message;

    const auto& rec = *result.record;
    return std::format(
        "Original Text Found:\n"
        "  - Text: {}\n"
        "  - Entity Type: {}\n"
        "  - First Seen: {}\n"
        "  - Last Seen: {}",
        rec.original_text, rec.entity_type, rec.first_seen, rec.last_seen);
}

} // namespace docanon

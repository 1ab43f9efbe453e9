#include "detector/pattern_detector.hpp"
#include "detector/languages.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>
#include <stdexcept>

namespace docanon {

namespace {

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char char_before(std::string_view text, size_t start) {
    return start > 0 ? text[start - 1] : '\0';
}

char char_after(std::string_view text, size_t end) {
    return end < text.size() ? text[end] : '\0';
}

std::string digits_of(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (is_digit(c)) digits += c;
    }
    return digits;
}

/**
 * @brief Luhn checksum over the digits of a card-number candidate (13-19 digits)
 */
bool luhn_valid(std::string_view text, size_t start, size_t end) {
    const auto digits = digits_of(text.substr(start, end - start));
    if (digits.size() < 13 || digits.size() > 19) return false;

    int sum = 0;
    bool doubled = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (doubled) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        doubled = !doubled;
    }
    return sum % 10 == 0;
}

/**
 * @brief Reject SSNs with area 000/666/9xx, group 00 or serial 0000
 */
bool ssn_valid(std::string_view text, size_t start, size_t end) {
    const auto digits = digits_of(text.substr(start, end - start));
    if (digits.size() != 9) return false;

    const int area = utils::try_parse_int<int>(std::string_view(digits).substr(0, 3)).value_or(0);
    const int group = utils::try_parse_int<int>(std::string_view(digits).substr(3, 2)).value_or(0);
    const int serial = utils::try_parse_int<int>(std::string_view(digits).substr(5, 4)).value_or(0);

    return area != 0 && area != 666 && area < 900 && group != 0 && serial != 0;
}

bool phone_bounded(std::string_view text, size_t start, size_t end) {
    const char before = char_before(text, start);
    return !is_word(before) && before != '+' && !is_word(char_after(text, end));
}

/**
 * @brief Dotted quad not embedded in a longer dotted number, octets <= 255
 */
bool ipv4_valid(std::string_view text, size_t start, size_t end) {
    if (start >= 2 && text[start - 1] == '.' && is_digit(text[start - 2])) return false;
    if (end + 1 < text.size() && text[end] == '.' && is_digit(text[end + 1])) return false;

    for (const auto& octet : utils::split(std::string(text.substr(start, end - start)), '.')) {
        const auto v = utils::try_parse_int<int>(octet);
        if (!v || *v > 255) return false;
    }
    return true;
}

bool ipv6_bounded(std::string_view text, size_t start, size_t /*end*/) {
    const char before = char_before(text, start);
    return !is_word(before) && before != ':';
}

/**
 * @brief Bare hex host ids (12-16 chars) outside paths, URLs and version strings
 */
bool hex_host_bounded(std::string_view text, size_t start, size_t end) {
    const char before = char_before(text, start);
    return before != ':' && before != '/' && char_after(text, end) != '.';
}

constexpr const char* kUrlPattern =
    R"((?:https?://|ftp://|www\.)[^\s]+\.(?:com|net|org|edu|gov|mil|int|br|app|dev|io|co|uk|de|fr|es|it|ru|cn|jp|kr|au|ca|mx|ar|cl|pe|co\.uk|com\.br|org\.br|gov\.br|edu\.br|net\.br|vercel\.app|herokuapp\.com|github\.io|gitlab\.io|netlify\.app|firebase\.app|appspot\.com|cloudfront\.net|amazonaws\.com|azure\.com|digitalocean\.com)[^\s]*)";

constexpr const char* kIpv6Pattern =
    R"((?:(?:[0-9A-Fa-f]{1,4}:){7}[0-9A-Fa-f]{1,4})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,6}:[0-9A-Fa-f]{1,4})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,5}(?::[0-9A-Fa-f]{1,4}){1,2})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,4}(?::[0-9A-Fa-f]{1,4}){1,3})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,3}(?::[0-9A-Fa-f]{1,4}){1,4})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,2}(?::[0-9A-Fa-f]{1,4}){1,5})"
    R"(|[0-9A-Fa-f]{1,4}:(?::[0-9A-Fa-f]{1,4}){1,6})"
    R"(|::(?:[0-9A-Fa-f]{1,4}:){0,5}[0-9A-Fa-f]{1,4})"
    R"(|(?:[0-9A-Fa-f]{1,4}:){1,7}:))"
    R"((?![0-9A-Fa-f:]))";

} // anonymous namespace

PatternDetector::PatternDetector(const std::vector<CustomRecognizer>& custom) {
    // PII
    add("EMAIL_ADDRESS", "email",
        R"([a-zA-Z0-9](?:[a-zA-Z0-9._%+-]*[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]*[a-zA-Z0-9])?\.[a-zA-Z]{2,8})",
        0.85);
    add("PHONE_NUMBER", "phone",
        R"((?:\+?1[-. ]?)?(?:\(\d{3}\)|\d{3})[-. ]?\d{3}[-. ]?\d{4})",
        0.65, phone_bounded);
    add("US_SSN", "ssn", R"(\b\d{3}[- ]\d{2}[- ]\d{4}\b)", 0.85, ssn_valid);
    add("CREDIT_CARD", "credit_card", R"(\b(?:\d{4}[- ]?){3}\d{1,7}\b)", 0.9, luhn_valid);

    // Infrastructure identifiers
    add("URL", "url", kUrlPattern, 0.7);
    add("IP_ADDRESS", "ipv4", R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", 0.6, ipv4_valid);
    add("IP_ADDRESS", "ipv6", kIpv6Pattern, 0.6, ipv6_bounded);
    add("HOSTNAME", "fqdn",
        R"(\b(?:[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}\b)", 0.6);
    add("HOSTNAME", "localhost", R"(\blocalhost\b)", 0.65);
    add("HOSTNAME", "certificate_cn",
        R"(CN=(?:[a-zA-Z0-9][a-zA-Z0-9-]{0,61}[a-zA-Z0-9]|[a-f0-9]{8,16})\b)", 0.7);
    add("HOSTNAME", "hex_host", R"(\b(?!20\d{10})[a-f0-9]{12,16}\b)", 0.6, hex_host_bounded);
    add("HASH", "sha256", R"(\b[0-9a-fA-F]{64}\b)", 0.8);
    add("HASH", "md5_colon", R"(\b(?:[0-9a-fA-F]{2}:){15}[0-9a-fA-F]{2}\b)", 0.85);
    add("UUID", "uuid",
        R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)", 0.8);
    add("CERT_SERIAL", "serial_hex40", R"(\b[0-9a-fA-F]{40}\b)", 0.75);
    add("CPE_STRING", "cpe", R"(\bcpe:/[a-z]:[^:\s]+:[^:\s]+(?::[^:\s]+){0,4}\b)", 0.7);
    add("CERT_BODY", "base64_mii", R"(\bMII[a-zA-Z0-9+/=\n]{100,}\b)", 0.8);

    for (const auto& rec : custom) {
        if (rec.entity_type.empty()) {
            throw std::invalid_argument("Custom recognizer requires an entity_type");
        }
        for (size_t i = 0; i < rec.patterns.size(); ++i) {
            add(utils::to_upper(rec.entity_type),
                std::format("custom_{}_{}", utils::to_lower(rec.entity_type), i),
                rec.patterns[i], rec.score);
        }
    }

    utils::log::debug(std::format("PatternDetector: {} recognizers loaded", recognizers_.size()));
}

void PatternDetector::add(std::string entity_type, std::string name, const std::string& pattern,
                          double score, Validator validator) {
    Recognizer rec;
    rec.entity_type = std::move(entity_type);
    rec.name = std::move(name);
    rec.score = score;
    rec.validator = std::move(validator);
    try {
        rec.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument(std::format(
            "Recognizer '{}' has an invalid pattern: {}", rec.name, e.what()));
    }
    recognizers_.push_back(std::move(rec));
}

std::vector<DetectedSpan> PatternDetector::analyze(
    const std::string& text,
    const std::string& language,
    double score_threshold,
    const std::unordered_set<std::string>& entity_types) {

    if (!is_supported_language(language)) {
        throw std::invalid_argument(std::format("Unsupported language: {}", language));
    }

    std::vector<DetectedSpan> spans;
    const std::string_view view(text);

    for (const auto& rec : recognizers_) {
        if (rec.score < score_threshold) continue;
        if (!entity_types.count(rec.entity_type)) continue;

        const auto end = std::sregex_iterator();
        for (auto it = std::sregex_iterator(text.begin(), text.end(), rec.regex); it != end; ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;

            const auto start = static_cast<size_t>(m.position(0));
            const auto stop = start + static_cast<size_t>(m.length(0));
            if (rec.validator && !rec.validator(view, start, stop)) continue;

            spans.emplace_back(start, stop, rec.entity_type, rec.score);
        }
    }

    std::stable_sort(spans.begin(), spans.end(),
        [](const DetectedSpan& a, const DetectedSpan& b) { return a.start < b.start; });
    return spans;
}

std::vector<std::string> PatternDetector::supported_entities(const std::string& language) const {
    if (!is_supported_language(language)) return {};

    std::set<std::string> types;
    for (const auto& rec : recognizers_) {
        types.insert(rec.entity_type);
    }
    return {types.begin(), types.end()};
}

} // namespace docanon

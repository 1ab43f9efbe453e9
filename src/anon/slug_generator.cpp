#include "anon/slug_generator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <format>

namespace docanon {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

SlugGenerator::SlugGenerator(const SecretKey& key, std::optional<size_t> slug_length)
    : key_(key.key_bytes),
      slug_length_(slug_length.value_or(kMaxSlugLength)) {
    if (key_.empty()) {
        throw ConfigurationError("Secret key must not be empty");
    }
    if (!utils::in_range<1, kMaxSlugLength>(slug_length_)) {
        throw ConfigurationError(std::format(
            "slug length must be between 1 and {}, got {}", kMaxSlugLength, slug_length_));
    }
}

std::string SlugGenerator::normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

std::string SlugGenerator::full_hash(std::string_view normalized) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* ok = HMAC(EVP_sha256(),
         key_.data(), static_cast<int>(key_.size()),
         reinterpret_cast<const unsigned char*>(normalized.data()),
         normalized.size(),
         digest, &digest_len);
    if (!ok) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string SlugGenerator::display_hash(const std::string& full) const {
    return full.substr(0, slug_length_);
}

std::string SlugGenerator::format_token(const std::string& entity_type,
                                        const std::string& display) {
    return std::format("[{}_{}]", entity_type, display);
}

std::string SlugGenerator::generate(std::string_view text,
                                    const std::string& entity_type,
                                    std::vector<CollectedEntity>& collector,
                                    RunCounters& counters) const {
    auto normalized = normalize(text);
    auto full = full_hash(normalized);
    auto display = display_hash(full);
    auto token = format_token(entity_type, display);

    collector.push_back({entity_type, std::move(normalized), std::move(display), std::move(full)});
    ++counters.total_entities_processed;
    ++counters.entity_counts[entity_type];

    return token;
}

} // namespace docanon

#pragma once

#include "core/types.hpp"
#include "security/env_key_manager.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docanon {

/**
 * @brief Deterministic keyed pseudonymization
 *
 * Turns a detected span into a redaction token `[ENTITY_TYPE_displayhash]`
 * where display hash is a prefix of the lowercase-hex HMAC-SHA256 of the
 * whitespace-normalized text under the process secret key.
 *
 * Same key + same normalized text + same type always yields the same token.
 * Truncated display hashes can collide; reverse lookup then returns the first
 * stored match.
 */
class SlugGenerator {
public:
    static constexpr size_t kMaxSlugLength = kFullHashLength;

    /**
     * @throws ConfigurationError if the key is empty or slug_length is outside [1, 64]
     */
    SlugGenerator(const SecretKey& key, std::optional<size_t> slug_length);

    /**
     * @brief Produce the token for one span
     *
     * Appends (type, normalized text, display hash, full hash) to `collector`
     * and bumps `counters`.
     */
    std::string generate(std::string_view text,
                         const std::string& entity_type,
                         std::vector<CollectedEntity>& collector,
                         RunCounters& counters) const;

    /**
     * @brief Collapse whitespace runs to one space and trim both ends
     */
    [[nodiscard]] static std::string normalize(std::string_view text);

    /**
     * @brief 64-char lowercase hex HMAC-SHA256 of already-normalized text
     */
    [[nodiscard]] std::string full_hash(std::string_view normalized) const;

    [[nodiscard]] std::string display_hash(const std::string& full) const;

    [[nodiscard]] static std::string format_token(const std::string& entity_type,
                                                  const std::string& display);

    [[nodiscard]] size_t slug_length() const { return slug_length_; }

private:
    std::string key_;
    size_t slug_length_;
};

} // namespace docanon

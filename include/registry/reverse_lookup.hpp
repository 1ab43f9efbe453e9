#pragma once

#include "core/types.hpp"
#include "registry/entity_registry.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace docanon {

enum class LookupStatus {
    FOUND,
    NOT_FOUND,
    INVALID_TOKEN,
    REGISTRY_MISSING,
    REGISTRY_ERROR
};

/**
 * @brief Token split into its two parts
 */
struct ParsedToken {
    std::string entity_type;
    std::string display_hash;
};

struct LookupResult {
    LookupStatus status = LookupStatus::NOT_FOUND;
    std::optional<EntityRecord> record;
    std::string message;

    [[nodiscard]] bool found() const { return status == LookupStatus::FOUND; }
};

/**
 * @brief Token -> original text, for authorized holders of the registry
 *
 * Never throws: malformed tokens, a missing registry and backend failures all
 * come back as a LookupResult with a descriptive message.
 */
class ReverseLookup {
public:
    /**
     * @param registry Open registry, or nullptr when the store does not exist yet
     */
    explicit ReverseLookup(EntityRegistry* registry);

    /**
     * @brief Split `[TYPE_hash]` on '_' (type = first part, hash = last part)
     * @return nullopt if there are fewer than two parts or the hash is empty
     */
    [[nodiscard]] static std::optional<ParsedToken> parse_token(std::string_view token);

    /**
     * @brief Exact match on the stored display hash
     *
     * A 64-hex-character body that matches no display hash is retried as a
     * full hash, so tokens can be resolved from the canonical hash even when
     * the run that wrote them used a shorter slug_length.
     */
    [[nodiscard]] LookupResult lookup(const std::string& token) const;

    /**
     * @brief Human-readable report of a lookup, as printed by docanon-deanon
     */
    [[nodiscard]] static std::string format_result(const LookupResult& result);

private:
    EntityRegistry* registry_;
};

} // namespace docanon

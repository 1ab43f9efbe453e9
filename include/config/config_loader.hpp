#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace docanon {

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief TOML -> AnonymizerConfig
 *
 * `${VAR}` in any string value is replaced by the environment variable
 * (empty when unset). A top-level `include = "x.toml"` or `include = [...]`
 * merges other files underneath the including one; the including file wins
 * for scalars, arrays are concatenated.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AnonymizerConfig config;

        static LoadResult ok(AnonymizerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem found, one message each; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AnonymizerConfig& config);

private:
    static LoadResult validate_and_return(AnonymizerConfig config);
};

} // namespace docanon

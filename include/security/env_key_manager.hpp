#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace docanon {

/**
 * @brief Process-wide pseudonymization key
 *
 * The key bytes are used verbatim as the HMAC key. Held read-only for the
 * lifetime of the process and passed by const reference.
 */
struct SecretKey {
    std::string key_id;
    std::string key_bytes;
    std::chrono::system_clock::time_point loaded_at;

    SecretKey() : loaded_at(std::chrono::system_clock::now()) {}
};

/**
 * @brief Environment variable key manager
 *
 * Reads the secret key once from an environment variable (default
 * ANON_SECRET_KEY). The value is taken as-is; no decoding. No rotation:
 * changing the key changes every token, so a restart with the new value is
 * the only supported path.
 */
class EnvKeyManager {
public:
    static constexpr const char* kDefaultEnvVar = "ANON_SECRET_KEY";

    explicit EnvKeyManager(const std::string& env_var_name = kDefaultEnvVar);

    [[nodiscard]] std::optional<SecretKey> get_active_key() const;

    /**
     * @brief Return the key or throw ConfigurationError naming the variable
     */
    [[nodiscard]] const SecretKey& require_key() const;

    [[nodiscard]] const std::string& env_var_name() const { return env_var_name_; }

private:
    std::string env_var_name_;
    SecretKey key_;
    bool valid_ = false;
};

} // namespace docanon

#include "security/env_key_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>

namespace docanon {

EnvKeyManager::EnvKeyManager(const std::string& env_var_name)
    : env_var_name_(env_var_name) {
    const char* raw_key = std::getenv(env_var_name.c_str());
    if (!raw_key || std::string(raw_key).empty()) {
        utils::log::warn(std::format("EnvKeyManager: environment variable '{}' not set", env_var_name));
        return;
    }

    key_.key_bytes = raw_key;
    key_.key_id = std::format("env:{}", env_var_name);
    key_.loaded_at = std::chrono::system_clock::now();
    valid_ = true;

    if (key_.key_bytes.size() < 16) {
        utils::log::warn(std::format("EnvKeyManager: key from '{}' is only {} bytes",
            env_var_name, key_.key_bytes.size()));
    }

    utils::log::debug(std::format("EnvKeyManager: loaded {}-byte key from '{}'",
        key_.key_bytes.size(), env_var_name));
}

std::optional<SecretKey> EnvKeyManager::get_active_key() const {
    if (!valid_) return std::nullopt;
    return key_;
}

const SecretKey& EnvKeyManager::require_key() const {
    if (!valid_) {
        throw ConfigurationError(
            std::format("{} environment variable not set", env_var_name_));
    }
    return key_;
}

} // namespace docanon

#include "registry/open_registry.hpp"
#include "db/backend_registry.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace docanon {

std::unique_ptr<EntityRegistry> open_registry(const RegistryConfig& config, bool create_if_missing) {
    register_builtin_backends();

    const auto type = parse_database_type(config.backend);
    const bool is_sqlite = type == DatabaseType::SQLITE;
    const auto& target = is_sqlite ? config.path : config.connection_string;

    if (is_sqlite && !create_if_missing && target != ":memory:" &&
        !std::filesystem::exists(target)) {
        utils::log::debug(std::format("Registry file {} does not exist", target));
        return nullptr;
    }

    auto registry = std::make_unique<EntityRegistry>(BackendRegistry::instance().connect(type, target));
    registry->initialize();
    utils::log::debug(std::format("Registry open ({})", database_type_to_string(type)));
    return registry;
}

} // namespace docanon

#pragma once

#include "config/config_types.hpp"
#include "registry/entity_registry.hpp"

#include <memory>

namespace docanon {

/**
 * @brief Connect the configured backend and ensure the schema exists
 *
 * With `create_if_missing` false, a SQLite registry whose file does not
 * exist yields nullptr instead of an empty new store.
 *
 * @throws std::runtime_error on unknown backend or connection failure
 * @throws RegistryError if schema creation fails
 */
[[nodiscard]] std::unique_ptr<EntityRegistry> open_registry(const RegistryConfig& config,
                                                            bool create_if_missing = true);

} // namespace docanon

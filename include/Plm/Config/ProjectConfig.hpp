/**
 * @file ProjectConfig.hpp
 * @brief Project manifest types: the project itself and its per-plugin configuration
 * @author Plm Team
 * @version 1.0.0
 *
 * @details ProjectConfig is the only durable state the manager owns. It is
 * persisted as JSON by ConfigStore; the glaze metadata below describes the
 * on-disk shape used when writing. Reading goes through the tolerant DTOs in
 * ConfigStore.cpp so that missing optional fields fall back to defaults.
 */

#pragma once

#include <glaze/glaze.hpp>

#include <Plm/Utils/Error.hpp>
#include <Plm/Utils/Types.hpp>

namespace plm::config {
  /**
   * @struct PluginConfig
   * @brief Per-plugin configuration as declared in the project manifest.
   */
  struct PluginConfig {
    utils::types::String name;           ///< Must match the registered plugin name.
    utils::types::String version;        ///< Requested version; may be empty.
    bool                 enabled = true; ///< Disabled entries are skipped by discovery.
    glz::json_t          payload;        ///< Opaque plugin-owned settings ("config" on disk).

    static fn named(utils::types::String name, utils::types::String version = {}) -> PluginConfig;

    fn operator==(const PluginConfig& other) const -> bool;
  };

  /**
   * @struct ProjectInfo
   * @brief Identity of the project the plugins belong to.
   */
  struct ProjectInfo {
    utils::types::String name;
    utils::types::String version;
    utils::types::String rootPath;
    utils::types::String description; ///< Free text; empty when the document has none.

    fn operator==(const ProjectInfo&) const -> bool = default;
  };

  /**
   * @struct ProjectConfig
   * @brief Root aggregate: project info plus an insertion-ordered, name-unique plugin set.
   */
  struct ProjectConfig {
    ProjectInfo                     project;
    utils::types::Vec<PluginConfig> plugins;

    /**
     * @brief Creates an empty configuration for a project.
     * @param name Project name.
     * @param rootPath Project root directory.
     */
    static fn defaultForProject(const utils::types::String& name, const utils::types::String& rootPath) -> ProjectConfig;

    [[nodiscard]] fn findPlugin(utils::types::StringView name) const -> const PluginConfig*;
    [[nodiscard]] fn findPlugin(utils::types::StringView name) -> PluginConfig*;

    /**
     * @brief Inserts a plugin config, replacing an existing one with the same name in place.
     * @return true if a new entry was appended, false if an existing one was replaced.
     */
    fn upsertPlugin(PluginConfig plugin) -> bool;

    fn removePlugin(utils::types::StringView name) -> utils::types::Option<PluginConfig>;

    /**
     * @brief Checks the structural rules: non-empty project name, non-empty and unique plugin names.
     * @return ConfigMalformed describing the first violation.
     */
    [[nodiscard]] fn validate() const -> utils::types::Result<utils::types::Unit>;

    fn operator==(const ProjectConfig&) const -> bool = default;
  };
} // namespace plm::config

template <>
struct glz::meta<plm::config::PluginConfig> {
  using T = plm::config::PluginConfig;

  static constexpr auto value = glz::object(
    "name",
    &T::name,
    "version",
    &T::version,
    "enabled",
    &T::enabled,
    "config",
    &T::payload
  );
};

template <>
struct glz::meta<plm::config::ProjectInfo> {
  using T = plm::config::ProjectInfo;

  static constexpr auto value = glz::object(
    "name",
    &T::name,
    "version",
    &T::version,
    "description",
    &T::description,
    "root_path",
    &T::rootPath
  );
};

template <>
struct glz::meta<plm::config::ProjectConfig> {
  using T = plm::config::ProjectConfig;

  static constexpr auto value = glz::object("project", &T::project, "plugins", &T::plugins);
};

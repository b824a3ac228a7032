/**
 * @file ConfigStore.hpp
 * @brief JSON persistence for ProjectConfig
 * @author Plm Team
 * @version 1.0.0
 *
 * @details The store holds one in-memory ProjectConfig and moves it to and
 * from disk. It only checks the document's shape; whether the plugins it
 * names actually exist is the validator's and discovery's business.
 *
 * Saving writes a sibling temporary file and renames it over the target, so
 * readers see either the old document or the new one, never a torn write.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "ProjectConfig.hpp"

namespace plm::config {
  namespace fs = std::filesystem;

  class ConfigStore {
   public:
    ConfigStore() = default;
    explicit ConfigStore(ProjectConfig config);

    /**
     * @brief Reads and validates a configuration file.
     * @return ConfigNotFound if the file does not exist, ConfigIoError if it cannot
     *         be read, ConfigMalformed if it is not a well-formed project document.
     */
    static fn loadFromFile(const fs::path& path) -> utils::types::Result<ProjectConfig>;

    /// Parses a configuration document already in memory.
    static fn parse(utils::types::StringView json) -> utils::types::Result<ProjectConfig>;

    /// Pretty-printed JSON for a configuration.
    static fn serialize(const ProjectConfig& config) -> utils::types::Result<utils::types::String>;

    /**
     * @brief Atomically writes a configuration to disk.
     * @details Parent directories are created as needed. On failure the
     *          previous file, if any, is left untouched.
     */
    static fn saveToFile(const ProjectConfig& config, const fs::path& path) -> utils::types::Result<utils::types::Unit>;

    /// Replaces the in-memory configuration with the file's contents.
    fn load(const fs::path& path) -> utils::types::Result<utils::types::Unit>;

    fn save(const fs::path& path) const -> utils::types::Result<utils::types::Unit>;

    [[nodiscard]] fn get() const -> ProjectConfig;

    /// Replaces the in-memory configuration; rejected if it fails validation.
    fn set(ProjectConfig config) -> utils::types::Result<utils::types::Unit>;

    /// Inserts a plugin config or replaces the one with the same name, keeping its position.
    fn addPluginConfig(PluginConfig plugin) -> utils::types::Result<utils::types::Unit>;

    fn removePluginConfig(utils::types::StringView name) -> utils::types::Option<PluginConfig>;

    [[nodiscard]] fn getPluginConfig(utils::types::StringView name) const -> utils::types::Option<PluginConfig>;

    /**
     * @brief Flips a plugin config's enabled flag.
     * @return NotFound if the configuration has no entry with that name.
     */
    fn setPluginEnabled(utils::types::StringView name, bool enabled) -> utils::types::Result<PluginConfig>;

   private:
    mutable utils::types::Mutex m_mutex;
    ProjectConfig               m_config;
  };
} // namespace plm::config

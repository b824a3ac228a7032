/**
 * @file Settings.hpp
 * @brief Host-side settings for the plugin manager, read from TOML
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Every key is optional; anything missing keeps its default. An
 * example document with the defaults:
 *
 * @code{.toml}
 * [logging]
 * level = "info"              # debug | info | warn | error
 *
 * [discovery]
 * auto_discover = false
 * plugins_dir = ""
 * require_descriptor = false
 *
 * [operations]
 * timeout_ms = 0              # 0 waits forever
 * contention = "queue"        # queue | reject
 * validate_on_install = true
 * @endcode
 */

#pragma once

#include <chrono>                    // std::chrono::milliseconds
#include <filesystem>                // std::filesystem::path
#include <toml++/impl/table.hpp>     // toml::table

#include "../Core/OperationLock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace plm::config {
  struct LoggingSettings {
    utils::logging::LogLevel level = utils::logging::LogLevel::Info;

    static fn fromToml(const toml::table& tbl) -> LoggingSettings;
  };

  struct DiscoverySettings {
    bool                  autoDiscover      = false; ///< Run discovery from PluginManager::initialize().
    std::filesystem::path pluginsDir;                ///< Descriptor directory; empty disables the scan.
    bool                  requireDescriptor = false; ///< Config entries without a descriptor are failures.

    static fn fromToml(const toml::table& tbl) -> DiscoverySettings;
  };

  struct OperationSettings {
    std::chrono::milliseconds      timeout { 0 };
    core::plugin::ContentionPolicy contention        = core::plugin::ContentionPolicy::Queue;
    bool                           validateOnInstall = true; ///< Refuse to install entries the validator flags.

    /// The timeout, or None when operations may wait forever.
    [[nodiscard]] fn effectiveTimeout() const -> utils::types::Option<std::chrono::milliseconds>;

    static fn fromToml(const toml::table& tbl) -> OperationSettings;
  };

  /**
   * @struct Settings
   * @brief Everything the host can tune about the manager.
   */
  struct Settings {
    LoggingSettings   logging;
    DiscoverySettings discovery;
    OperationSettings operations;

    Settings() = default;

    /**
     * @brief Builds settings from a parsed document, falling back to defaults for missing tables.
     * @param tbl Root table containing [logging], [discovery] and [operations].
     */
    explicit Settings(const toml::table& tbl);

    /**
     * @brief Parses a settings file.
     * @return ConfigNotFound if the file is missing, ConfigMalformed if it is not valid TOML.
     */
    static fn loadFromFile(const std::filesystem::path& path) -> utils::types::Result<Settings>;

    static fn fromString(utils::types::StringView document) -> utils::types::Result<Settings>;
  };
} // namespace plm::config

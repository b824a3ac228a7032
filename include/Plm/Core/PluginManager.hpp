/**
 * @file PluginManager.hpp
 * @brief Single entry point over the registry, config store, discovery, validation and install orchestration
 * @author Plm Team
 * @version 1.0.0
 *
 * @details The manager is an ordinary object owned by the host. Several
 * managers may coexist (one per project, or one per test). It is safe to call
 * from many threads at once: lifecycle operations on one plugin are serialized
 * by that plugin's lock, operations on different plugins run in parallel.
 *
 * Plugin configs live in the config store. Whenever a config is added,
 * removed, or the whole project config is replaced, the copy attached to the
 * matching registry entry is refreshed.
 */

#pragma once

#include <atomic>     // std::atomic
#include <filesystem> // std::filesystem::path

#include "../Config/ConfigStore.hpp"
#include "../Config/ProjectConfig.hpp"
#include "../Config/Settings.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "DiscoveryService.hpp"
#include "InstallOrchestrator.hpp"
#include "PluginRegistry.hpp"
#include "Validator.hpp"

namespace plm::core::plugin {
  class PluginManager {
   public:
    explicit PluginManager(config::Settings settings = {});
    PluginManager(config::ProjectConfig project, config::Settings settings = {});

    PluginManager(const PluginManager&)                = delete;
    PluginManager(PluginManager&&)                     = delete;
    fn operator=(const PluginManager&)->PluginManager& = delete;
    fn operator=(PluginManager&&)->PluginManager&      = delete;

    /// Shuts every plugin down if shutdown() was not called.
    ~PluginManager();

    /**
     * @brief Applies the log level, runs discovery if enabled, then initializes every Registered plugin.
     * @details Idempotent. One plugin failing does not stop the others.
     * @return InitializationFailed naming every plugin that failed.
     */
    fn initialize() -> Result<Unit>;

    /**
     * @brief Waits for abandoned operations, then shuts down every active plugin.
     * @details With an operation timeout configured, a plugin still busy after
     *          that long is left running and reported as failed.
     * @return ShutdownFailed naming every plugin that could not be shut down.
     */
    fn shutdown() -> Result<Unit>;

    [[nodiscard]] fn isInitialized() const -> bool {
      return m_initialized;
    }

    /// Registers the enabled plugins declared in the project config. Returns how many were added.
    fn discoverPlugins() -> utils::types::usize;

    fn discoverPluginsDetailed() -> DiscoveryReport;

    [[nodiscard]] fn validateAllPlugins() const -> ValidationSummary;

    [[nodiscard]] fn listPlugins() const -> Vec<PluginInfo>;

    [[nodiscard]] fn stateOf(const String& name) const -> Option<LifecycleState>;

    /// Registers under the name the plugin reports, attaching its stored config if any.
    fn registerPlugin(SharedPointer<IPlugin> plugin) -> Result<OperationOutcome>;

    fn unregisterPlugin(const String& name) -> Result<OperationOutcome>;

    fn initializePlugin(const String& name, bool verbose = false) -> Result<OperationOutcome>;

    fn shutdownPlugin(const String& name, bool verbose = false) -> Result<OperationOutcome>;

    fn installPlugin(const String& name, const Option<String>& version = None, const InstallOptions& options = {}) -> Result<OperationOutcome>;

    fn uninstallPlugin(const String& name, const Option<String>& version = None, const InstallOptions& options = {}) -> Result<OperationOutcome>;

    [[nodiscard]] fn getPluginConfig(const String& name) const -> Option<config::PluginConfig>;

    /// In memory only until saveConfig().
    fn addPluginConfig(config::PluginConfig plugin) -> Result<Unit>;

    fn removePluginConfig(const String& name) -> Option<config::PluginConfig>;

    fn enablePlugin(const String& name) -> Result<Unit>;
    fn disablePlugin(const String& name) -> Result<Unit>;

    fn loadConfig(const std::filesystem::path& path) -> Result<Unit>;
    fn saveConfig(const std::filesystem::path& path) const -> Result<Unit>;

    fn setProjectConfig(config::ProjectConfig project) -> Result<Unit>;
    [[nodiscard]] fn getProjectConfig() const -> config::ProjectConfig;

    [[nodiscard]] fn settings() const -> const config::Settings& {
      return m_settings;
    }

    /// Direct registry access, e.g. to install a state observer.
    [[nodiscard]] fn registry() -> PluginRegistry& {
      return m_registry;
    }

    /// Install/uninstall operations still running after their caller timed out.
    [[nodiscard]] fn pendingOperations() -> utils::types::usize;

   private:
    fn syncConfig(const String& name, Option<config::PluginConfig> config) -> Unit;
    fn syncAllConfigs() -> Unit;

    config::Settings    m_settings;
    config::ConfigStore m_store;
    PluginRegistry      m_registry;
    DiscoveryService    m_discovery;
    Validator           m_validator;
    InstallOrchestrator m_orchestrator;

    utils::types::Mutex m_lifecycleMutex;
    std::atomic<bool>   m_initialized = false;
  };
} // namespace plm::core::plugin

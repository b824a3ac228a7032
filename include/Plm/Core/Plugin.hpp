/**
 * @file Plugin.hpp
 * @brief Capability interface every plugin implementation satisfies
 * @author Plm Team
 * @version 1.0.0
 *
 * @details A plugin is an opaque implementation supplied by the host. The
 * manager only ever talks to it through IPlugin: it reads metadata, then
 * drives it through initialize -> install/uninstall -> shutdown. Which of
 * those calls are legal at a given moment is decided by the registry's state
 * machine, never by the plugin itself.
 *
 * Hooks are ordinary blocking calls from the plugin's point of view. The
 * install orchestrator runs install/uninstall as background tasks so that a
 * caller can stop waiting without abandoning the operation half-way.
 */

#pragma once

#include <chrono>     // std::chrono::milliseconds
#include <filesystem> // std::filesystem::path

#include <Plm/Config/ProjectConfig.hpp>
#include <Plm/Utils/Error.hpp>
#include <Plm/Utils/Logging.hpp>
#include <Plm/Utils/Types.hpp>

namespace plm::core::plugin {
  /**
   * @struct PluginMetadata
   * @brief What a plugin says about itself. Only name and version are checked by the manager.
   */
  struct PluginMetadata {
    utils::types::String                       name;
    utils::types::String                       version;
    utils::types::String                       description;
    utils::types::String                       author;
    utils::types::Option<utils::types::String> homepage;
    utils::types::Option<utils::types::String> repository;
    utils::types::Vec<utils::types::String>    supportedPlatforms { "linux", "macos", "windows" };
    utils::types::Vec<utils::types::String>    tags;
    utils::types::Vec<utils::types::String>    dependencies;  ///< Names of plugins this one builds on.
    utils::types::Option<utils::types::String> minPlmVersion; ///< Oldest manager version the plugin supports.
  };

  /**
   * @struct InstallOptions
   * @brief Per-call switches for install and uninstall.
   */
  struct InstallOptions {
    bool force   = false; ///< Bypass the "already installed" / "not installed" guards.
    bool dryRun  = false; ///< Validate only; never call the hook, never change state.
    bool verbose = false; ///< Record and log a step trace. Never changes behaviour.

    /// Overrides the manager-wide operation timeout for this call.
    utils::types::Option<std::chrono::milliseconds> timeout;
  };

  /**
   * @struct PluginContext
   * @brief What a plugin is told about its environment when it is initialized.
   */
  struct PluginContext {
    utils::types::String                       name;
    std::filesystem::path                      projectRoot;
    utils::types::Option<config::PluginConfig> config;
  };

  class IPlugin {
   public:
    IPlugin()                              = default;
    IPlugin(const IPlugin&)                = default;
    IPlugin(IPlugin&&)                     = delete;
    fn operator=(const IPlugin&)->IPlugin& = default;
    fn operator=(IPlugin&&)->IPlugin&      = delete;
    virtual ~IPlugin()                     = default;

    /// Must be pure and callable in any state.
    [[nodiscard]] virtual fn getMetadata() const -> const PluginMetadata& = 0;

    virtual fn initialize(const PluginContext& ctx) -> utils::types::Result<utils::types::Unit> = 0;

    virtual fn shutdown() -> utils::types::Result<utils::types::Unit> = 0;

    /**
     * @brief Performs the version-specific installation.
     * @param version Resolved, well-formed version string.
     * @param options The caller's options (dryRun is never set here).
     * @return A descriptor of what was installed; opaque to the manager.
     */
    virtual fn install(const utils::types::String& version, const InstallOptions& options) -> utils::types::Result<utils::types::String> = 0;

    virtual fn uninstall(const utils::types::String& version) -> utils::types::Result<utils::types::Unit> = 0;
  };
} // namespace plm::core::plugin

#if defined(_WIN32)
  #if defined(PLM_PLUGIN_BUILD)
    #define PLM_PLUGIN_API __declspec(dllexport)
  #else
    #define PLM_PLUGIN_API __declspec(dllimport)
  #endif
#else
  #define PLM_PLUGIN_API __attribute__((visibility("default")))
#endif

/**
 * @def PLM_PLUGIN
 * @brief Generates the factory functions for a plugin class
 *
 * @param PluginClass The plugin class to instantiate (must be default-constructible)
 * @param PluginName  The name the plugin is catalogued under
 *
 * For static builds the plugin registers itself in the static catalog at
 * startup. For shared-library builds it exports the extern "C" entry points
 * the dynamic loader looks up.
 *
 * @example
 * @code
 * PLM_PLUGIN(NodePlugin, "node")
 * @endcode
 */
#ifdef PLM_STATIC_PLUGIN_BUILD
  #include <Plm/Core/StaticPlugins.hpp>
  #define PLM_PLUGIN(PluginClass, PluginName)                               \
    static fn Create_##PluginClass() -> plm::core::plugin::IPlugin* {       \
      return new PluginClass();                                             \
    }                                                                       \
    static fn Destroy_##PluginClass(plm::core::plugin::IPlugin* p) -> void { \
      delete p;                                                             \
    }                                                                       \
    static const bool g_##PluginClass##_registered =                        \
      plm::core::plugin::RegisterStaticPlugin({ PluginName, Create_##PluginClass, Destroy_##PluginClass });
#else
  #define PLM_PLUGIN(PluginClass, PluginName)                                                     \
    extern "C" PLM_PLUGIN_API fn CreatePlugin() -> plm::core::plugin::IPlugin* {                  \
      return new PluginClass();                                                                   \
    }                                                                                             \
    extern "C" PLM_PLUGIN_API fn DestroyPlugin(plm::core::plugin::IPlugin* plugin) -> void {      \
      delete plugin;                                                                              \
    }                                                                                             \
    extern "C" PLM_PLUGIN_API fn SetPluginLogLevelPtr(plm::utils::logging::LogLevel* ptr) -> void { \
      plm::utils::logging::SetLogLevelPtr(ptr);                                                   \
    }                                                                                             \
    extern "C" PLM_PLUGIN_API fn GetPluginName() -> const char* {                                 \
      return PluginName;                                                                          \
    }
#endif

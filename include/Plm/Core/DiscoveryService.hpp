/**
 * @file DiscoveryService.hpp
 * @brief Turns the plugins declared in a ProjectConfig into registry entries
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Candidates are the project's plugin configs, in declaration order.
 * When a plugins directory is configured it is scanned for descriptor files:
 *
 * @code{.json}
 * { "name": "node", "version": "1.2.0", "description": "...", "author": "...", "library": "libnode.so" }
 * @endcode
 *
 * A descriptor cross-checks the candidate's version and may name a shared
 * library (relative to the plugins directory) that provides the
 * implementation. Candidates without a library come from the static catalog.
 *
 * Discovery only ever adds entries. One candidate failing never stops the rest.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Config/ProjectConfig.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "PluginRegistry.hpp"

namespace plm::core::plugin {
  struct PluginDescriptor {
    String   name;
    String   version;
    String   description;
    String   author;
    String   library; ///< Shared library path; empty for statically linked plugins.
    fs::path source;  ///< The descriptor file itself.
  };

  struct DiscoveryOptions {
    fs::path pluginsDir;                ///< Empty disables the descriptor scan.
    bool     requireDescriptor = false; ///< Treat candidates without a descriptor as failures.
  };

  /**
   * @struct DiscoveryReport
   * @brief What one discovery pass did.
   */
  struct DiscoveryReport {
    utils::types::usize registered        = 0;
    utils::types::usize skippedDisabled   = 0;
    utils::types::usize alreadyRegistered = 0;
    Vec<PluginFailure>  failures;
    Vec<String>         registeredNames;
  };

  class DiscoveryService {
   public:
    explicit DiscoveryService(PluginRegistry& registry, DiscoveryOptions options = {});

    fn setOptions(DiscoveryOptions options) -> Unit;

    fn discover(const config::ProjectConfig& config) -> DiscoveryReport;

    /**
     * @brief Parses one descriptor file.
     * @return ConfigNotFound/ConfigIoError for unreadable files, ConfigMalformed for bad content.
     */
    static fn loadDescriptor(const fs::path& file) -> Result<PluginDescriptor>;

   private:
    struct ScanResult {
      Map<String, PluginDescriptor> descriptors;
      Vec<PluginFailure>            failures;
    };

    fn scanDescriptors() const -> ScanResult;
    fn instantiate(const String& name, const PluginDescriptor* descriptor) const -> Result<SharedPointer<IPlugin>>;
    fn discoverOne(const config::PluginConfig& candidate, const PluginDescriptor* descriptor) -> Result<Unit>;

    PluginRegistry&  m_registry;
    DiscoveryOptions m_options;
  };
} // namespace plm::core::plugin

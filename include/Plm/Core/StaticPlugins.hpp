/**
 * @file StaticPlugins.hpp
 * @brief Catalog of plugin implementations linked into the host binary
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Plugins compiled into the host register a create/destroy pair here,
 * either through the PLM_PLUGIN macro at static initialization or explicitly
 * by the host before discovery runs. Discovery consults the catalog for every
 * candidate that has no shared library of its own.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "Plugin.hpp"

namespace plm::core::plugin {
  /**
   * @struct StaticPluginEntry
   * @brief Entry for a statically available plugin implementation
   */
  struct StaticPluginEntry {
    utils::types::String name;
    IPlugin* (*createFunc)();
    void (*destroyFunc)(IPlugin*);
  };

  /**
   * @brief Register a static plugin (called automatically by PLM_PLUGIN)
   * @param entry The plugin entry to register; the first entry for a name wins
   * @return true (used to enable static initialization)
   */
  fn RegisterStaticPlugin(StaticPluginEntry entry) -> bool;

  /**
   * @brief Get a copy of every registered static plugin entry
   */
  fn GetStaticPlugins() -> utils::types::Vec<StaticPluginEntry>;

  fn IsStaticPlugin(const utils::types::String& name) -> bool;

  /**
   * @brief Create a shared instance of a static plugin
   * @param name The catalog name
   * @return The instance (destroyed through the entry's destroyFunc), or None if the
   *         name is unknown or the factory returned nullptr
   */
  fn CreateStaticPlugin(const utils::types::String& name) -> utils::types::Option<utils::types::SharedPointer<IPlugin>>;
} // namespace plm::core::plugin

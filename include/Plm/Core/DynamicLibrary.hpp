#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Plugin.hpp"

namespace plm::core::plugin {
  /**
   * @brief Loads a plugin shared library built with PLM_PLUGIN and instantiates it.
   * @details The library must export CreatePlugin and DestroyPlugin. If it also
   *          exports SetPluginLogLevelPtr it is pointed at the host's log level.
   *          If it exports GetPluginName, the name must match expectedName
   *          before anything is instantiated.
   *
   *          The returned pointer owns both the instance and the library: when
   *          the last copy goes away the instance is destroyed through
   *          DestroyPlugin and the library is closed.
   * @param path Path to the shared library.
   * @param expectedName Name the plugin is being loaded under.
   * @return LoadFailed if the library cannot be opened, lacks the entry points,
   *         provides a different plugin or does not produce an instance.
   */
  fn LoadDynamicPlugin(const std::filesystem::path& path, utils::types::StringView expectedName) -> utils::types::Result<utils::types::SharedPointer<IPlugin>>;
} // namespace plm::core::plugin

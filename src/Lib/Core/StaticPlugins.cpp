/**
 * @file StaticPlugins.cpp
 * @brief Static plugin catalog implementation
 * @author Plm Team
 * @version 1.0.0
 */

#include <Plm/Core/StaticPlugins.hpp>

#include <algorithm> // std::ranges::any_of, std::ranges::find_if

namespace plm::core::plugin {
  using namespace utils::types;

  namespace {
    fn GetStaticPluginMutex() -> Mutex& {
      static Mutex Instance;
      return Instance;
    }

    fn GetStaticPluginRegistry() -> Vec<StaticPluginEntry>& {
      static Vec<StaticPluginEntry> Registry;
      return Registry;
    }
  } // namespace

  fn RegisterStaticPlugin(StaticPluginEntry entry) -> bool {
    const LockGuard lock(GetStaticPluginMutex());

    Vec<StaticPluginEntry>& registry = GetStaticPluginRegistry();

    const bool known = std::ranges::any_of(registry, [&entry](const StaticPluginEntry& existing) {
      return existing.name == entry.name;
    });

    if (!known)
      registry.push_back(std::move(entry));

    return true;
  }

  fn GetStaticPlugins() -> Vec<StaticPluginEntry> {
    const LockGuard lock(GetStaticPluginMutex());
    return GetStaticPluginRegistry();
  }

  fn IsStaticPlugin(const String& name) -> bool {
    const LockGuard lock(GetStaticPluginMutex());

    return std::ranges::any_of(GetStaticPluginRegistry(), [&name](const StaticPluginEntry& entry) {
      return entry.name == name;
    });
  }

  fn CreateStaticPlugin(const String& name) -> Option<SharedPointer<IPlugin>> {
    StaticPluginEntry entry;

    {
      const LockGuard lock(GetStaticPluginMutex());

      const Vec<StaticPluginEntry>& registry = GetStaticPluginRegistry();

      const auto iter = std::ranges::find_if(registry, [&name](const StaticPluginEntry& candidate) {
        return candidate.name == name;
      });

      if (iter == registry.end())
        return None;

      entry = *iter;
    }

    IPlugin* instance = entry.createFunc();
    if (!instance)
      return None;

    return SharedPointer<IPlugin>(instance, entry.destroyFunc);
  }
} // namespace plm::core::plugin

#include <Plm/Config/ProjectConfig.hpp>

#include <algorithm> // std::ranges::find_if
#include <format>    // std::format

#include <Plm/Utils/Error.hpp>
#include <Plm/Utils/Types.hpp>

namespace plm::config {
  using namespace utils::types;

  namespace {
    // json_t has no equality of its own; compare the canonical (sorted-key) serialization.
    fn PayloadEquals(const glz::json_t& lhs, const glz::json_t& rhs) -> bool {
      String lhsJson;
      String rhsJson;

      if (glz::write_json(lhs, lhsJson) || glz::write_json(rhs, rhsJson))
        return false;

      return lhsJson == rhsJson;
    }
  } // namespace

  fn PluginConfig::named(String name, String version) -> PluginConfig {
    PluginConfig config;
    config.name    = std::move(name);
    config.version = std::move(version);
    return config;
  }

  fn PluginConfig::operator==(const PluginConfig& other) const -> bool {
    return name == other.name && version == other.version && enabled == other.enabled && PayloadEquals(payload, other.payload);
  }

  fn ProjectConfig::defaultForProject(const String& name, const String& rootPath) -> ProjectConfig {
    return {
      .project = { .name = name, .version = "1.0.0", .rootPath = rootPath },
      .plugins = {},
    };
  }

  fn ProjectConfig::findPlugin(const StringView name) const -> const PluginConfig* {
    const auto iter = std::ranges::find_if(plugins, [name](const PluginConfig& plugin) { return plugin.name == name; });
    return iter == plugins.end() ? nullptr : &*iter;
  }

  fn ProjectConfig::findPlugin(const StringView name) -> PluginConfig* {
    const auto iter = std::ranges::find_if(plugins, [name](const PluginConfig& plugin) { return plugin.name == name; });
    return iter == plugins.end() ? nullptr : &*iter;
  }

  fn ProjectConfig::upsertPlugin(PluginConfig plugin) -> bool {
    if (PluginConfig* existing = findPlugin(plugin.name)) {
      *existing = std::move(plugin);
      return false;
    }

    plugins.push_back(std::move(plugin));
    return true;
  }

  fn ProjectConfig::removePlugin(const StringView name) -> Option<PluginConfig> {
    const auto iter = std::ranges::find_if(plugins, [name](const PluginConfig& plugin) { return plugin.name == name; });

    if (iter == plugins.end())
      return None;

    PluginConfig removed = std::move(*iter);
    plugins.erase(iter);
    return removed;
  }

  fn ProjectConfig::validate() const -> Result<Unit> {
    if (project.name.empty())
      ERR(ConfigMalformed, "project.name must not be empty");

    for (usize idx = 0; idx < plugins.size(); ++idx) {
      if (plugins[idx].name.empty())
        ERR_FMT(ConfigMalformed, "plugins[{}].name must not be empty", idx);

      for (usize prev = 0; prev < idx; ++prev)
        if (plugins[prev].name == plugins[idx].name)
          ERR_FMT(ConfigMalformed, "Duplicate plugin name '{}' at plugins[{}]", plugins[idx].name, idx);
    }

    return {};
  }
} // namespace plm::config

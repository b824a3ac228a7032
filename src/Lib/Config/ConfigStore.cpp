#include <Plm/Config/ConfigStore.hpp>

#include <fstream>      // std::{ifstream, ofstream}
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code

#include <glaze/glaze.hpp>

#include <Plm/Utils/Logging.hpp>

namespace {
  using namespace plm::utils::types;

  // On-disk shape used for reading. Optional members may be omitted from the
  // document; everything else is required.
  struct PluginConfigDocument {
    String              name;
    Option<String>      version;
    Option<bool>        enabled;
    Option<glz::json_t> config;
  };

  struct ProjectInfoDocument {
    String         name;
    Option<String> version;
    Option<String> root_path;
    Option<String> description;
  };

  struct ProjectConfigDocument {
    ProjectInfoDocument               project;
    Option<Vec<PluginConfigDocument>> plugins;
  };

  constexpr glz::opts READ_OPTS { .error_on_unknown_keys = false, .error_on_missing_keys = true };

  // Serializes file access across every store in the process.
  fn GetFileMutex() -> Mutex& {
    static Mutex FileMutex;
    return FileMutex;
  }
} // namespace

namespace plm::config {
  using namespace utils::types;

  ConfigStore::ConfigStore(ProjectConfig config) : m_config(std::move(config)) {}

  fn ConfigStore::parse(const StringView json) -> Result<ProjectConfig> {
    ProjectConfigDocument document;

    // glaze expects a null-terminated buffer.
    const String buffer(json);

    if (const glz::error_ctx errc = glz::read<READ_OPTS>(document, buffer); errc)
      ERR_FMT(ConfigMalformed, "Invalid project configuration: {}", glz::format_error(errc, buffer));

    ProjectConfig config;

    config.project = ProjectInfo {
      .name     = std::move(document.project.name),
      .version  = document.project.version.value_or(""),
      .rootPath    = document.project.root_path.value_or(""),
      .description = document.project.description.value_or(""),
    };

    if (document.plugins) {
      config.plugins.reserve(document.plugins->size());

      for (PluginConfigDocument& plugin : *document.plugins)
        config.plugins.push_back(PluginConfig {
          .name    = std::move(plugin.name),
          .version = plugin.version.value_or(""),
          .enabled = plugin.enabled.value_or(true),
          .payload = plugin.config ? std::move(*plugin.config) : glz::json_t {},
        });
    }

    TRY_VOID(config.validate());

    return config;
  }

  fn ConfigStore::serialize(const ProjectConfig& config) -> Result<String> {
    String buffer;

    if (const glz::error_ctx errc = glz::write<glz::opts { .prettify = true }>(config, buffer); errc)
      ERR_FMT(ConfigIoError, "Failed to serialize project configuration: {}", glz::format_error(errc, buffer));

    return buffer;
  }

  fn ConfigStore::loadFromFile(const fs::path& path) -> Result<ProjectConfig> {
    String contents;

    {
      const LockGuard fileLock(GetFileMutex());

      std::error_code errc;

      if (!fs::exists(path, errc)) {
        if (errc)
          ERR_FMT(ConfigIoError, "Failed to stat {}: {}", path.string(), errc.message());

        ERR_FMT(ConfigNotFound, "Configuration file {} does not exist", path.string());
      }

      if (!fs::is_regular_file(path, errc))
        ERR_FMT(ConfigIoError, "{} is not a regular file", path.string());

      std::ifstream file(path, std::ios::binary);

      if (!file)
        ERR_FMT(ConfigIoError, "Failed to open {}", path.string());

      contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

      if (file.bad())
        ERR_FMT(ConfigIoError, "Failed to read {}", path.string());
    }

    Result<ProjectConfig> config = parse(contents);

    if (!config)
      ERR_FMT(ConfigMalformed, "{}: {}", path.string(), config.error().message);

    debug_log("Loaded project '{}' with {} plugin(s) from {}", config->project.name, config->plugins.size(), path.string());

    return config;
  }

  fn ConfigStore::saveToFile(const ProjectConfig& config, const fs::path& path) -> Result<Unit> {
    TRY_VOID(config.validate());

    const String json = TRY(serialize(config));

    const LockGuard fileLock(GetFileMutex());

    std::error_code errc;

    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), errc);

      if (errc)
        ERR_FMT(ConfigIoError, "Failed to create {}: {}", path.parent_path().string(), errc.message());
    }

    fs::path tempPath = path;
    tempPath += ".tmp";

    {
      std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);

      if (!file)
        ERR_FMT(ConfigIoError, "Failed to open {} for writing", tempPath.string());

      file << json;
      file.flush();

      if (!file) {
        file.close();
        fs::remove(tempPath, errc);
        ERR_FMT(ConfigIoError, "Failed to write {}", tempPath.string());
      }
    }

    fs::rename(tempPath, path, errc);

    if (errc) {
      const String reason = errc.message();
      fs::remove(tempPath, errc);
      ERR_FMT(ConfigIoError, "Failed to replace {}: {}", path.string(), reason);
    }

    debug_log("Saved project '{}' to {}", config.project.name, path.string());

    return {};
  }

  fn ConfigStore::load(const fs::path& path) -> Result<Unit> {
    ProjectConfig config = TRY(loadFromFile(path));

    const LockGuard lock(m_mutex);
    m_config = std::move(config);

    return {};
  }

  fn ConfigStore::save(const fs::path& path) const -> Result<Unit> {
    return saveToFile(get(), path);
  }

  fn ConfigStore::get() const -> ProjectConfig {
    const LockGuard lock(m_mutex);
    return m_config;
  }

  fn ConfigStore::set(ProjectConfig config) -> Result<Unit> {
    TRY_VOID(config.validate());

    const LockGuard lock(m_mutex);
    m_config = std::move(config);

    return {};
  }

  fn ConfigStore::addPluginConfig(PluginConfig plugin) -> Result<Unit> {
    if (plugin.name.empty())
      ERR(InvalidArgument, "Plugin config name must not be empty");

    const LockGuard lock(m_mutex);
    m_config.upsertPlugin(std::move(plugin));

    return {};
  }

  fn ConfigStore::removePluginConfig(const StringView name) -> Option<PluginConfig> {
    const LockGuard lock(m_mutex);
    return m_config.removePlugin(name);
  }

  fn ConfigStore::getPluginConfig(const StringView name) const -> Option<PluginConfig> {
    const LockGuard lock(m_mutex);

    if (const PluginConfig* plugin = m_config.findPlugin(name))
      return *plugin;

    return None;
  }

  fn ConfigStore::setPluginEnabled(const StringView name, const bool enabled) -> Result<PluginConfig> {
    const LockGuard lock(m_mutex);

    PluginConfig* plugin = m_config.findPlugin(name);

    if (!plugin)
      ERR_FMT(NotFound, "No configuration for plugin '{}'", name);

    plugin->enabled = enabled;

    return *plugin;
  }
} // namespace plm::config

#include <Plm/Config/Settings.hpp>

#include <system_error> // std::error_code

#include <magic_enum/magic_enum.hpp>
#include <toml++/toml.hpp>

namespace plm::config {
  using namespace utils::types;
  using core::plugin::ContentionPolicy;
  using utils::logging::LogLevel;

  namespace {
    template <typename Enum>
    fn ParseEnum(const toml::table& tbl, const StringView key, const Enum fallback) -> Enum {
      const Option<String> value = tbl[key].value<String>();

      if (!value)
        return fallback;

      if (const Option<Enum> parsed = magic_enum::enum_cast<Enum>(*value, magic_enum::case_insensitive))
        return *parsed;

      warn_log("Unknown value '{}' for '{}', using '{}'", *value, key, magic_enum::enum_name(fallback));
      return fallback;
    }
  } // namespace

  fn LoggingSettings::fromToml(const toml::table& tbl) -> LoggingSettings {
    LoggingSettings settings;

    settings.level = ParseEnum(tbl, "level", settings.level);

    return settings;
  }

  fn DiscoverySettings::fromToml(const toml::table& tbl) -> DiscoverySettings {
    DiscoverySettings settings;

    settings.autoDiscover      = tbl["auto_discover"].value_or(false);
    settings.requireDescriptor = tbl["require_descriptor"].value_or(false);

    if (const Option<String> dir = tbl["plugins_dir"].value<String>())
      settings.pluginsDir = *dir;

    return settings;
  }

  fn OperationSettings::fromToml(const toml::table& tbl) -> OperationSettings {
    OperationSettings settings;

    if (const Option<i64> timeoutMs = tbl["timeout_ms"].value<i64>()) {
      if (*timeoutMs < 0)
        warn_log("operations.timeout_ms must not be negative, got {}; waiting forever", *timeoutMs);
      else
        settings.timeout = std::chrono::milliseconds(*timeoutMs);
    }

    settings.contention        = ParseEnum(tbl, "contention", settings.contention);
    settings.validateOnInstall = tbl["validate_on_install"].value_or(settings.validateOnInstall);

    return settings;
  }

  fn OperationSettings::effectiveTimeout() const -> Option<std::chrono::milliseconds> {
    if (timeout.count() <= 0)
      return None;

    return timeout;
  }

  Settings::Settings(const toml::table& tbl) {
    if (const toml::node_view loggingTbl = tbl["logging"]; loggingTbl.is_table())
      this->logging = LoggingSettings::fromToml(*loggingTbl.as_table());

    if (const toml::node_view discoveryTbl = tbl["discovery"]; discoveryTbl.is_table())
      this->discovery = DiscoverySettings::fromToml(*discoveryTbl.as_table());

    if (const toml::node_view operationsTbl = tbl["operations"]; operationsTbl.is_table())
      this->operations = OperationSettings::fromToml(*operationsTbl.as_table());
  }

  fn Settings::loadFromFile(const std::filesystem::path& path) -> Result<Settings> {
    if (std::error_code errc; !std::filesystem::exists(path, errc))
      ERR_FMT(ConfigNotFound, "Settings file {} does not exist", path.string());

    try {
      const toml::table tbl = toml::parse_file(path.string());

      debug_log("Settings loaded from {}", path.string());

      return Settings(tbl);
    } catch (const toml::parse_error& err) {
      ERR_FMT(ConfigMalformed, "Failed to parse {}: {}", path.string(), err.description());
    }
  }

  fn Settings::fromString(const StringView document) -> Result<Settings> {
    try {
      return Settings(toml::parse(document));
    } catch (const toml::parse_error& err) {
      ERR_FMT(ConfigMalformed, "Failed to parse settings: {}", err.description());
    }
  }
} // namespace plm::config

#include <Plm/Core/DiscoveryService.hpp>

#include <algorithm>    // std::ranges::sort
#include <fstream>      // std::ifstream
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code

#include <glaze/glaze.hpp>

#include <Plm/Core/DynamicLibrary.hpp>
#include <Plm/Core/StaticPlugins.hpp>
#include <Plm/Utils/Logging.hpp>
#include <Plm/Utils/Version.hpp>

namespace {
  using namespace plm::utils::types;

  struct DescriptorDocument {
    String         name;
    String         version;
    Option<String> description;
    Option<String> author;
    Option<String> library;
  };
} // namespace

namespace plm::core::plugin {
  using utils::version::IsValidSemver;

  DiscoveryService::DiscoveryService(PluginRegistry& registry, DiscoveryOptions options)
    : m_registry(registry), m_options(std::move(options)) {}

  fn DiscoveryService::setOptions(DiscoveryOptions options) -> Unit {
    m_options = std::move(options);
  }

  fn DiscoveryService::loadDescriptor(const fs::path& file) -> Result<PluginDescriptor> {
    std::ifstream stream(file, std::ios::binary);

    if (!stream) {
      if (std::error_code errc; !fs::exists(file, errc))
        ERR_FMT(ConfigNotFound, "Descriptor {} does not exist", file.string());

      ERR_FMT(ConfigIoError, "Failed to open descriptor {}", file.string());
    }

    const String buffer { std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>() };

    if (stream.bad())
      ERR_FMT(ConfigIoError, "Failed to read descriptor {}", file.string());

    DescriptorDocument document;

    if (const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false, .error_on_missing_keys = true }>(document, buffer); errc)
      ERR_FMT(ConfigMalformed, "Malformed descriptor {}: {}", file.string(), glz::format_error(errc, buffer));

    if (document.name.empty())
      ERR_FMT(ConfigMalformed, "Descriptor {} has an empty name", file.string());

    if (!IsValidSemver(document.version))
      ERR_FMT(ConfigMalformed, "Descriptor {} declares invalid version '{}'", file.string(), document.version);

    return PluginDescriptor {
      .name        = std::move(document.name),
      .version     = std::move(document.version),
      .description = document.description.value_or(""),
      .author      = document.author.value_or(""),
      .library     = document.library.value_or(""),
      .source      = file,
    };
  }

  fn DiscoveryService::scanDescriptors() const -> ScanResult {
    ScanResult result;

    if (m_options.pluginsDir.empty())
      return result;

    std::error_code errc;

    if (!fs::is_directory(m_options.pluginsDir, errc)) {
      warn_log("Plugins directory {} does not exist; no descriptors loaded", m_options.pluginsDir.string());
      return result;
    }

    Vec<fs::path> files;

    for (const fs::directory_entry& entry : fs::directory_iterator(m_options.pluginsDir, errc))
      if (entry.is_regular_file(errc) && entry.path().extension() == ".json")
        files.push_back(entry.path());

    if (errc)
      warn_log("Error while scanning {}: {}", m_options.pluginsDir.string(), errc.message());

    std::ranges::sort(files);

    for (const fs::path& file : files) {
      Result<PluginDescriptor> descriptor = loadDescriptor(file);

      if (!descriptor) {
        result.failures.push_back({ file.stem().string(), descriptor.error() });
        continue;
      }

      const String name = descriptor->name;

      if (result.descriptors.contains(name)) {
        result.failures.push_back({
          name,
          PlmError(utils::error::PlmErrorCode::ConfigMalformed, std::format("Duplicate descriptor for '{}' in {}", name, file.string())),
        });
        continue;
      }

      debug_log("Found descriptor for '{}' v{} in {}", name, descriptor->version, file.string());
      result.descriptors.emplace(name, std::move(*descriptor));
    }

    return result;
  }

  fn DiscoveryService::instantiate(const String& name, const PluginDescriptor* descriptor) const -> Result<SharedPointer<IPlugin>> {
    if (descriptor && !descriptor->library.empty()) {
      fs::path library = descriptor->library;

      if (library.is_relative())
        library = m_options.pluginsDir / library;

      return LoadDynamicPlugin(library, name);
    }

    if (!IsStaticPlugin(name))
      ERR_FMT(LoadFailed, "No implementation available for plugin '{}'", name);

    if (Option<SharedPointer<IPlugin>> instance = CreateStaticPlugin(name))
      return std::move(*instance);

    ERR_FMT(LoadFailed, "Static factory for plugin '{}' produced no instance", name);
  }

  fn DiscoveryService::discoverOne(const config::PluginConfig& candidate, const PluginDescriptor* descriptor) -> Result<Unit> {
    if (!descriptor && m_options.requireDescriptor)
      ERR_FMT(NotFound, "Plugin '{}' has no descriptor in {}", candidate.name, m_options.pluginsDir.string());

    if (descriptor && !candidate.version.empty() && descriptor->version != candidate.version)
      ERR_FMT(InvalidArgument, "Plugin '{}' is configured for version {} but its descriptor declares {}", candidate.name, candidate.version, descriptor->version);

    SharedPointer<IPlugin> instance = TRY(instantiate(candidate.name, descriptor));

    if (const String& reported = instance->getMetadata().name; reported != candidate.name)
      ERR_FMT(LoadFailed, "Implementation for '{}' reports itself as '{}'", candidate.name, reported);

    TRY(m_registry.registerPlugin(candidate.name, std::move(instance), candidate));

    return {};
  }

  fn DiscoveryService::discover(const config::ProjectConfig& config) -> DiscoveryReport {
    DiscoveryReport report;

    ScanResult scan = scanDescriptors();
    report.failures = std::move(scan.failures);

    for (const config::PluginConfig& candidate : config.plugins) {
      if (!candidate.enabled) {
        debug_log("Skipping disabled plugin '{}'", candidate.name);
        ++report.skippedDisabled;
        continue;
      }

      if (m_registry.isActive(candidate.name)) {
        ++report.alreadyRegistered;
        continue;
      }

      const auto              iter       = scan.descriptors.find(candidate.name);
      const PluginDescriptor* descriptor = iter == scan.descriptors.end() ? nullptr : &iter->second;

      if (Result<Unit> result = discoverOne(candidate, descriptor); !result) {
        warn_log("Discovery of plugin '{}' failed: {}", candidate.name, result.error().message);
        report.failures.push_back({ candidate.name, result.error() });
        continue;
      }

      ++report.registered;
      report.registeredNames.push_back(candidate.name);
    }

    info_log(
      "Discovery registered {} plugin(s), skipped {} disabled, {} already registered, {} failure(s)",
      report.registered,
      report.skippedDisabled,
      report.alreadyRegistered,
      report.failures.size()
    );

    return report;
  }
} // namespace plm::core::plugin

/**
 * @file PluginManager.cpp
 * @brief Plugin manager façade implementation
 * @author Plm Team
 * @version 1.0.0
 */

#include <Plm/Core/PluginManager.hpp>

#include <format> // std::format

#include <Plm/Utils/Logging.hpp>

namespace plm::core::plugin {
  using namespace utils::types;
  using utils::error::PlmErrorCode;

  namespace {
    fn DescribeFailures(const Vec<PluginFailure>& failures) -> String {
      String description;

      for (const PluginFailure& failure : failures) {
        if (!description.empty())
          description += "; ";

        description += std::format("{}: {}", failure.plugin, failure.error.message);
      }

      return description;
    }

    fn MakeDiscoveryOptions(const config::DiscoverySettings& settings) -> DiscoveryOptions {
      return { .pluginsDir = settings.pluginsDir, .requireDescriptor = settings.requireDescriptor };
    }
  } // namespace

  PluginManager::PluginManager(config::Settings settings)
    : m_settings(std::move(settings)),
      m_registry(m_settings.operations.contention),
      m_discovery(m_registry, MakeDiscoveryOptions(m_settings.discovery)),
      m_validator(m_registry),
      m_orchestrator(m_registry, m_settings.operations.effectiveTimeout()) {
    m_orchestrator.setValidateOnInstall(m_settings.operations.validateOnInstall);
  }

  PluginManager::PluginManager(config::ProjectConfig project, config::Settings settings)
    : m_settings(std::move(settings)),
      m_store(std::move(project)),
      m_registry(m_settings.operations.contention),
      m_discovery(m_registry, MakeDiscoveryOptions(m_settings.discovery)),
      m_validator(m_registry),
      m_orchestrator(m_registry, m_settings.operations.effectiveTimeout()) {
    m_orchestrator.setValidateOnInstall(m_settings.operations.validateOnInstall);
    m_registry.setProjectRoot(m_store.get().project.rootPath);
  }

  PluginManager::~PluginManager() {
    if (Result<Unit> result = shutdown(); !result)
      error_at(result.error());
  }

  fn PluginManager::initialize() -> Result<Unit> {
    const LockGuard lock(m_lifecycleMutex);

    if (m_initialized)
      return {};

    utils::logging::SetRuntimeLogLevel(m_settings.logging.level);

    debug_log("Initializing PluginManager...");

    if (m_settings.discovery.autoDiscover)
      m_discovery.discover(m_store.get());

    Vec<PluginFailure> failures;

    for (const PluginInfo& info : m_registry.listPlugins()) {
      if (info.state != LifecycleState::Registered)
        continue;

      if (Result<OperationOutcome> result = m_registry.initializeOne(info.name); !result) {
        warn_log("{}", result.error().message);
        failures.push_back({ info.name, result.error() });
      }
    }

    m_initialized = true;

    if (!failures.empty())
      ERR_FMT(InitializationFailed, "{} plugin(s) failed to initialize: {}", failures.size(), DescribeFailures(failures));

    debug_log("PluginManager initialized with {} active plugin(s)", m_registry.activeCount());

    return {};
  }

  fn PluginManager::shutdown() -> Result<Unit> {
    const LockGuard lock(m_lifecycleMutex);

    m_orchestrator.drain();

    const Vec<PluginFailure> failures = m_registry.shutdownAll(m_settings.operations.effectiveTimeout());

    m_initialized = false;

    if (!failures.empty())
      ERR_FMT(ShutdownFailed, "{} plugin(s) failed to shut down: {}", failures.size(), DescribeFailures(failures));

    return {};
  }

  fn PluginManager::discoverPlugins() -> usize {
    return discoverPluginsDetailed().registered;
  }

  fn PluginManager::discoverPluginsDetailed() -> DiscoveryReport {
    return m_discovery.discover(m_store.get());
  }

  fn PluginManager::validateAllPlugins() const -> ValidationSummary {
    return m_validator.validateAll();
  }

  fn PluginManager::listPlugins() const -> Vec<PluginInfo> {
    return m_registry.listPlugins();
  }

  fn PluginManager::stateOf(const String& name) const -> Option<LifecycleState> {
    return m_registry.stateOf(name);
  }

  fn PluginManager::registerPlugin(SharedPointer<IPlugin> plugin) -> Result<OperationOutcome> {
    if (!plugin)
      ERR(InvalidArgument, "Cannot register a null plugin");

    const String name = plugin->getMetadata().name;

    return m_registry.registerPlugin(name, std::move(plugin), m_store.getPluginConfig(name));
  }

  fn PluginManager::unregisterPlugin(const String& name) -> Result<OperationOutcome> {
    return m_registry.unregisterPlugin(name);
  }

  fn PluginManager::initializePlugin(const String& name, const bool verbose) -> Result<OperationOutcome> {
    return m_registry.initializeOne(name, verbose);
  }

  fn PluginManager::shutdownPlugin(const String& name, const bool verbose) -> Result<OperationOutcome> {
    return m_registry.shutdownOne(name, verbose);
  }

  fn PluginManager::installPlugin(const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome> {
    return m_orchestrator.installPlugin(name, version, options);
  }

  fn PluginManager::uninstallPlugin(const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome> {
    return m_orchestrator.uninstallPlugin(name, version, options);
  }

  fn PluginManager::getPluginConfig(const String& name) const -> Option<config::PluginConfig> {
    return m_store.getPluginConfig(name);
  }

  fn PluginManager::addPluginConfig(config::PluginConfig plugin) -> Result<Unit> {
    const String name = plugin.name;

    TRY_VOID(m_store.addPluginConfig(plugin));
    syncConfig(name, std::move(plugin));

    return {};
  }

  fn PluginManager::removePluginConfig(const String& name) -> Option<config::PluginConfig> {
    Option<config::PluginConfig> removed = m_store.removePluginConfig(name);

    if (removed)
      syncConfig(name, None);

    return removed;
  }

  fn PluginManager::enablePlugin(const String& name) -> Result<Unit> {
    syncConfig(name, TRY(m_store.setPluginEnabled(name, true)));
    return {};
  }

  fn PluginManager::disablePlugin(const String& name) -> Result<Unit> {
    syncConfig(name, TRY(m_store.setPluginEnabled(name, false)));
    return {};
  }

  fn PluginManager::loadConfig(const std::filesystem::path& path) -> Result<Unit> {
    TRY_VOID(m_store.load(path));
    syncAllConfigs();

    return {};
  }

  fn PluginManager::saveConfig(const std::filesystem::path& path) const -> Result<Unit> {
    return m_store.save(path);
  }

  fn PluginManager::setProjectConfig(config::ProjectConfig project) -> Result<Unit> {
    TRY_VOID(m_store.set(std::move(project)));
    syncAllConfigs();

    return {};
  }

  fn PluginManager::getProjectConfig() const -> config::ProjectConfig {
    return m_store.get();
  }

  fn PluginManager::pendingOperations() -> usize {
    return m_orchestrator.pendingCount();
  }

  fn PluginManager::syncConfig(const String& name, Option<config::PluginConfig> config) -> Unit {
    // Configs for plugins that are not registered are simply kept in the store.
    if (Result<Unit> result = m_registry.attachConfig(name, std::move(config)); !result && result.error().code != PlmErrorCode::NotFound)
      warn_at(result.error());
  }

  fn PluginManager::syncAllConfigs() -> Unit {
    const config::ProjectConfig project = m_store.get();

    m_registry.setProjectRoot(project.project.rootPath);

    for (const PluginInfo& info : m_registry.listPlugins()) {
      const config::PluginConfig* plugin = project.findPlugin(info.name);
      syncConfig(info.name, plugin ? Option<config::PluginConfig>(*plugin) : None);
    }
  }
} // namespace plm::core::plugin

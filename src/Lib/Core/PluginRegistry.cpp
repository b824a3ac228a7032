#include <Plm/Core/PluginRegistry.hpp>

#include <algorithm> // std::ranges::count_if

#include <Plm/Utils/Version.hpp>

namespace plm::core::plugin {
  using namespace utils::types;
  using utils::error::PlmErrorCode;
  using utils::version::IsValidSemver;

  namespace {
    // Runs a plugin hook, turning anything it throws into an error value.
    template <typename T, typename Hook>
    fn InvokeHook(Hook&& hook) -> Result<T> {
      try {
        return std::forward<Hook>(hook)();
      } catch (const Exception& e) {
        ERR_FMT(InternalError, "hook threw an exception: {}", e.what());
      } catch (...) {
        ERR(InternalError, "hook threw a non-standard exception");
      }
    }

    fn HookFailure(
      const PlmErrorCode          code,
      const String&               name,
      const StringView            action,
      const PlmError&             cause,
      const std::source_location& loc = std::source_location::current()
    ) -> PlmError {
      return { code, std::format("Plugin '{}' failed to {}: {}", name, action, cause.message), loc };
    }
  } // namespace

  PluginRegistry::PluginRegistry(const ContentionPolicy policy) : m_policy(policy) {}

  fn PluginRegistry::setContentionPolicy(const ContentionPolicy policy) -> Unit {
    const WriteLock lock(m_mutex);
    m_policy = policy;
  }

  fn PluginRegistry::contentionPolicy() const -> ContentionPolicy {
    const SharedLock lock(m_mutex);
    return m_policy;
  }

  fn PluginRegistry::setProjectRoot(fs::path root) -> Unit {
    const WriteLock lock(m_mutex);
    m_projectRoot = std::move(root);
  }

  fn PluginRegistry::setStateObserver(StateObserver observer) -> Unit {
    const LockGuard lock(m_observerMutex);
    m_observer = std::move(observer);
  }

  fn PluginRegistry::notify(const String& name, const LifecycleState from, const LifecycleState target) -> Unit {
    StateObserver observer;

    {
      const LockGuard lock(m_observerMutex);
      observer = m_observer;
    }

    if (observer)
      observer(name, from, target);
  }

  fn PluginRegistry::registerPlugin(const String& name, SharedPointer<IPlugin> capability, Option<config::PluginConfig> config) -> Result<OperationOutcome> {
    if (name.empty())
      ERR(InvalidArgument, "Plugin name must not be empty");

    if (!capability)
      ERR_FMT(InvalidArgument, "Plugin '{}' has no implementation", name);

    if (config && config->name != name)
      ERR_FMT(InvalidArgument, "Config for '{}' cannot be attached to plugin '{}'", config->name, name);

    auto entry = std::make_shared<PluginEntry>();

    entry->name     = name;
    entry->metadata = capability->getMetadata();
    entry->instance = std::move(capability);
    entry->config   = std::move(config);

    {
      const WriteLock lock(m_mutex);

      if (const auto iter = m_entries.find(name); iter != m_entries.end() && !IsTerminal(iter->second->state))
        ERR_FMT(AlreadyRegistered, "Plugin '{}' is already registered ({})", name, StateName(iter->second->state));

      entry->state = LifecycleState::Registered;
      m_entries.insert_or_assign(name, entry);
    }

    debug_log("Registered plugin '{}' v{}", name, entry->metadata.version);
    notify(name, LifecycleState::Unregistered, LifecycleState::Registered);

    return OperationOutcome {
      .plugin   = name,
      .previous = LifecycleState::Unregistered,
      .current  = LifecycleState::Registered,
    };
  }

  fn PluginRegistry::unregisterPlugin(const String& name) -> Result<OperationOutcome> {
    const SharedPointer<PluginEntry> entry = find(name);

    if (!entry)
      ERR_FMT(NotFound, "Plugin '{}' is not registered", name);

    OperationGuard guard = TRY(acquire(entry, contentionPolicy()));

    const LifecycleState previous = readState(*entry);

    switch (previous) {
      case LifecycleState::Registered:
        TRY_VOID(commitState(*entry, LifecycleState::Unregistered));
        break;
      case LifecycleState::Initialized:
      case LifecycleState::Installed: {
        OperationTrace trace(name, false);
        TRY(shutdownLocked(guard, trace));
        break;
      }
      case LifecycleState::Shutdown:
        // Only drops the audit record.
        break;
      default:
        ERR_FMT(InvalidState, "Cannot unregister plugin '{}' from state {}", name, StateName(previous));
    }

    erase(entry);
    debug_log("Unregistered plugin '{}'", name);

    return OperationOutcome {
      .plugin   = name,
      .previous = previous,
      .current  = readState(*entry),
    };
  }

  fn PluginRegistry::lockPlugin(const String& name, const Option<std::chrono::steady_clock::time_point> deadline) -> Result<OperationGuard> {
    const SharedPointer<PluginEntry> entry = find(name);

    if (!entry)
      ERR_FMT(NotFound, "Plugin '{}' is not registered", name);

    return acquire(entry, contentionPolicy(), deadline);
  }

  fn PluginRegistry::initializeOne(const String& name, const bool verbose) -> Result<OperationOutcome> {
    OperationGuard guard = TRY(lockPlugin(name));
    OperationTrace trace(name, verbose);

    trace.record("lock acquired");

    return initializeLocked(guard, trace);
  }

  fn PluginRegistry::shutdownOne(const String& name, const bool verbose) -> Result<OperationOutcome> {
    OperationGuard guard = TRY(lockPlugin(name));
    OperationTrace trace(name, verbose);

    trace.record("lock acquired");

    return shutdownLocked(guard, trace);
  }

  fn PluginRegistry::initializeLocked(OperationGuard& guard, OperationTrace& trace) -> Result<OperationOutcome> {
    PluginEntry& entry = guard.entry();

    const LifecycleState previous = readState(entry);

    if (previous != LifecycleState::Registered)
      ERR_FMT(InvalidState, "Cannot initialize plugin '{}' from state {}", entry.name, StateName(previous));

    PluginContext          ctx;
    SharedPointer<IPlugin> instance;

    {
      const SharedLock lock(m_mutex);

      ctx      = PluginContext { .name = entry.name, .projectRoot = m_projectRoot, .config = entry.config };
      instance = entry.instance;
    }

    trace.record("invoking initialize hook");

    if (const Result<Unit> result = InvokeHook<Unit>([&] { return instance->initialize(ctx); }); !result) {
      trace.record("initialize failed: {}", result.error().message);
      return Err(HookFailure(PlmErrorCode::InitializationFailed, entry.name, "initialize", result.error()));
    }

    TRY_VOID(commitState(entry, LifecycleState::Initialized));
    trace.record("state {} -> {}", StateName(previous), StateName(LifecycleState::Initialized));

    debug_log("Initialized plugin '{}'", entry.name);

    return OperationOutcome {
      .plugin   = entry.name,
      .previous = previous,
      .current  = LifecycleState::Initialized,
      .trace    = trace.take(),
    };
  }

  fn PluginRegistry::installLocked(OperationGuard& guard, const String& version, const InstallOptions& options, OperationTrace& trace) -> Result<OperationOutcome> {
    PluginEntry& entry = guard.entry();

    if (!IsValidSemver(version))
      ERR_FMT(InvalidArgument, "'{}' is not a valid version for plugin '{}'", version, entry.name);

    const LifecycleState previous = readState(entry);

    if (previous == LifecycleState::Installed && !options.force)
      ERR_FMT(InvalidState, "Plugin '{}' is already installed; use force to reinstall", entry.name);

    if (previous != LifecycleState::Initialized && previous != LifecycleState::Installed)
      ERR_FMT(InvalidState, "Cannot install plugin '{}' from state {}", entry.name, StateName(previous));

    if (options.dryRun) {
      trace.record("dry run: {} would be installed", version);

      return OperationOutcome {
        .plugin     = entry.name,
        .previous   = previous,
        .current    = previous,
        .descriptor = std::format("dry-run:{}@{}", entry.name, version),
        .dryRun     = true,
        .trace      = trace.take(),
      };
    }

    const SharedPointer<IPlugin> instance = readInstance(entry);

    trace.record("invoking install hook for {}", version);

    Result<String> descriptor = InvokeHook<String>([&] { return instance->install(version, options); });

    if (!descriptor) {
      trace.record("install failed: {}", descriptor.error().message);
      return Err(HookFailure(PlmErrorCode::InstallFailed, entry.name, std::format("install {}", version), descriptor.error()));
    }

    trace.record("install hook returned '{}'", *descriptor);

    TRY_VOID(commitState(entry, LifecycleState::Installed));

    {
      const WriteLock lock(m_mutex);
      entry.installedVersion = version;
    }

    trace.record("state {} -> {}", StateName(previous), StateName(LifecycleState::Installed));
    info_log("Installed plugin '{}' v{}", entry.name, version);

    return OperationOutcome {
      .plugin     = entry.name,
      .previous   = previous,
      .current    = LifecycleState::Installed,
      .descriptor = std::move(*descriptor),
      .trace      = trace.take(),
    };
  }

  fn PluginRegistry::uninstallLocked(OperationGuard& guard, const String& version, const InstallOptions& options, OperationTrace& trace) -> Result<OperationOutcome> {
    PluginEntry& entry = guard.entry();

    if (!IsValidSemver(version))
      ERR_FMT(InvalidArgument, "'{}' is not a valid version for plugin '{}'", version, entry.name);

    const LifecycleState previous = readState(entry);

    if (previous == LifecycleState::Initialized && !options.force)
      ERR_FMT(InvalidState, "Plugin '{}' is not installed; use force to uninstall anyway", entry.name);

    if (previous != LifecycleState::Initialized && previous != LifecycleState::Installed)
      ERR_FMT(InvalidState, "Cannot uninstall plugin '{}' from state {}", entry.name, StateName(previous));

    if (options.dryRun) {
      trace.record("dry run: {} would be uninstalled", version);

      return OperationOutcome {
        .plugin   = entry.name,
        .previous = previous,
        .current  = previous,
        .dryRun   = true,
        .trace    = trace.take(),
      };
    }

    const SharedPointer<IPlugin> instance = readInstance(entry);

    trace.record("invoking uninstall hook for {}", version);

    if (const Result<Unit> result = InvokeHook<Unit>([&] { return instance->uninstall(version); }); !result) {
      trace.record("uninstall failed: {}", result.error().message);
      return Err(HookFailure(PlmErrorCode::UninstallFailed, entry.name, std::format("uninstall {}", version), result.error()));
    }

    if (previous == LifecycleState::Installed) {
      TRY_VOID(commitState(entry, LifecycleState::Initialized));
      trace.record("state {} -> {}", StateName(previous), StateName(LifecycleState::Initialized));
    }

    {
      const WriteLock lock(m_mutex);
      entry.installedVersion.reset();
    }

    info_log("Uninstalled plugin '{}' v{}", entry.name, version);

    return OperationOutcome {
      .plugin   = entry.name,
      .previous = previous,
      .current  = LifecycleState::Initialized,
      .trace    = trace.take(),
    };
  }

  fn PluginRegistry::shutdownLocked(OperationGuard& guard, OperationTrace& trace) -> Result<OperationOutcome> {
    PluginEntry& entry = guard.entry();

    const LifecycleState previous = readState(entry);

    if (previous != LifecycleState::Initialized && previous != LifecycleState::Installed)
      ERR_FMT(InvalidState, "Cannot shut down plugin '{}' from state {}", entry.name, StateName(previous));

    const SharedPointer<IPlugin> instance = readInstance(entry);

    TRY_VOID(commitState(entry, LifecycleState::ShuttingDown));
    trace.record("invoking shutdown hook");

    if (const Result<Unit> result = InvokeHook<Unit>([&] { return instance->shutdown(); }); !result) {
      trace.record("shutdown failed: {}", result.error().message);
      TRY_VOID(commitState(entry, previous));
      return Err(HookFailure(PlmErrorCode::ShutdownFailed, entry.name, "shut down", result.error()));
    }

    TRY_VOID(commitState(entry, LifecycleState::Shutdown));
    trace.record("state {} -> {}", StateName(previous), StateName(LifecycleState::Shutdown));

    // Released outside the registry lock: a dynamic plugin's deleter unloads its library.
    SharedPointer<IPlugin> released;

    {
      const WriteLock lock(m_mutex);
      released = std::move(entry.instance);
    }

    debug_log("Shut down plugin '{}'", entry.name);

    return OperationOutcome {
      .plugin   = entry.name,
      .previous = previous,
      .current  = LifecycleState::Shutdown,
      .trace    = trace.take(),
    };
  }

  fn PluginRegistry::shutdownAll(const Option<std::chrono::milliseconds> lockTimeout) -> Vec<PluginFailure> {
    Vec<SharedPointer<PluginEntry>> active;

    {
      const SharedLock lock(m_mutex);

      for (const auto& [name, entry] : m_entries)
        if (!IsTerminal(entry->state))
          active.push_back(entry);
    }

    Vec<PluginFailure> failures;

    for (const SharedPointer<PluginEntry>& entry : active) {
      // Shutdown always waits its turn, whatever the contention policy.
      Option<std::chrono::steady_clock::time_point> deadline;

      if (lockTimeout)
        deadline = std::chrono::steady_clock::now() + *lockTimeout;

      Result<OperationGuard> guard = acquire(entry, ContentionPolicy::Queue, deadline);

      if (!guard) {
        warn_log("{}", guard.error().message);
        failures.push_back({ entry->name, guard.error() });
        continue;
      }

      const LifecycleState state = readState(*entry);

      if (state == LifecycleState::Registered) {
        if (Result<Unit> result = commitState(*entry, LifecycleState::Unregistered); !result)
          failures.push_back({ entry->name, result.error() });
        else
          erase(entry);

        continue;
      }

      if (IsTerminal(state))
        continue;

      OperationTrace trace(entry->name, false);

      if (Result<OperationOutcome> result = shutdownLocked(*guard, trace); !result) {
        warn_log("{}", result.error().message);
        failures.push_back({ entry->name, result.error() });
      }
    }

    return failures;
  }

  fn PluginRegistry::attachConfig(const String& name, Option<config::PluginConfig> config) -> Result<Unit> {
    if (config && config->name != name)
      ERR_FMT(InvalidArgument, "Config for '{}' cannot be attached to plugin '{}'", config->name, name);

    const WriteLock lock(m_mutex);

    const auto iter = m_entries.find(name);

    if (iter == m_entries.end())
      ERR_FMT(NotFound, "Plugin '{}' is not registered", name);

    iter->second->config = std::move(config);

    return {};
  }

  fn PluginRegistry::contains(const String& name) const -> bool {
    const SharedLock lock(m_mutex);
    return m_entries.contains(name);
  }

  fn PluginRegistry::isActive(const String& name) const -> bool {
    const SharedLock lock(m_mutex);

    const auto iter = m_entries.find(name);

    return iter != m_entries.end() && !IsTerminal(iter->second->state);
  }

  fn PluginRegistry::stateOf(const String& name) const -> Option<LifecycleState> {
    const SharedLock lock(m_mutex);

    if (const auto iter = m_entries.find(name); iter != m_entries.end())
      return iter->second->state;

    return None;
  }

  fn PluginRegistry::declaredVersion(const String& name) const -> Result<String> {
    const SharedLock lock(m_mutex);

    const auto iter = m_entries.find(name);

    if (iter == m_entries.end())
      ERR_FMT(NotFound, "Plugin '{}' is not registered", name);

    return iter->second->metadata.version;
  }

  fn PluginRegistry::describe(const OperationGuard& guard) const -> PluginInfo {
    const SharedLock lock(m_mutex);
    return snapshot(guard.entry());
  }

  fn PluginRegistry::installedVersion(const OperationGuard& guard) const -> Option<String> {
    const SharedLock lock(m_mutex);
    return guard.entry().installedVersion;
  }

  fn PluginRegistry::getPluginConfig(const String& name) const -> Option<config::PluginConfig> {
    const SharedLock lock(m_mutex);

    if (const auto iter = m_entries.find(name); iter != m_entries.end())
      return iter->second->config;

    return None;
  }

  fn PluginRegistry::listPlugins() const -> Vec<PluginInfo> {
    const SharedLock lock(m_mutex);

    Vec<PluginInfo> plugins;
    plugins.reserve(m_entries.size());

    for (const auto& [name, entry] : m_entries)
      if (!IsTerminal(entry->state))
        plugins.push_back(snapshot(*entry));

    return plugins;
  }

  fn PluginRegistry::listAll() const -> Vec<PluginInfo> {
    const SharedLock lock(m_mutex);

    Vec<PluginInfo> plugins;
    plugins.reserve(m_entries.size());

    for (const auto& [name, entry] : m_entries)
      plugins.push_back(snapshot(*entry));

    return plugins;
  }

  fn PluginRegistry::activeCount() const -> usize {
    const SharedLock lock(m_mutex);

    return static_cast<usize>(std::ranges::count_if(m_entries, [](const auto& item) { return !IsTerminal(item.second->state); }));
  }

  fn PluginRegistry::find(const String& name) const -> SharedPointer<PluginEntry> {
    const SharedLock lock(m_mutex);

    const auto iter = m_entries.find(name);

    return iter == m_entries.end() ? nullptr : iter->second;
  }

  fn PluginRegistry::acquire(
    const SharedPointer<PluginEntry>&                   entry,
    const ContentionPolicy                              policy,
    const Option<std::chrono::steady_clock::time_point> deadline
  ) -> Result<OperationGuard> {
    if (policy == ContentionPolicy::Reject) {
      if (!entry->lock.tryAcquire())
        ERR_FMT(InvalidState, "Plugin '{}' is busy with another operation", entry->name);
    } else if (deadline) {
      if (!entry->lock.acquireUntil(*deadline))
        ERR_FMT(Timeout, "Timed out waiting for plugin '{}' to finish its current operation", entry->name);
    } else
      entry->lock.acquire();

    return OperationGuard(entry);
  }

  fn PluginRegistry::readState(const PluginEntry& entry) const -> LifecycleState {
    const SharedLock lock(m_mutex);
    return entry.state;
  }

  fn PluginRegistry::readInstance(const PluginEntry& entry) const -> SharedPointer<IPlugin> {
    const SharedLock lock(m_mutex);
    return entry.instance;
  }

  fn PluginRegistry::commitState(PluginEntry& entry, const LifecycleState target) -> Result<Unit> {
    LifecycleState from = LifecycleState::Unregistered;

    {
      const WriteLock lock(m_mutex);

      from = entry.state;

      if (!IsTransitionAllowed(from, target))
        ERR_FMT(InternalError, "Illegal transition for plugin '{}': {} -> {}", entry.name, StateName(from), StateName(target));

      entry.state = target;
    }

    notify(entry.name, from, target);

    return {};
  }

  fn PluginRegistry::erase(const SharedPointer<PluginEntry>& entry) -> Unit {
    const WriteLock lock(m_mutex);

    // A Shutdown entry may already have been replaced by a fresh registration.
    if (const auto iter = m_entries.find(entry->name); iter != m_entries.end() && iter->second == entry)
      m_entries.erase(iter);
  }

  fn PluginRegistry::snapshot(const PluginEntry& entry) const -> PluginInfo {
    return PluginInfo {
      .name             = entry.name,
      .metadata         = entry.metadata,
      .state            = entry.state,
      .installedVersion = entry.installedVersion,
      .config           = entry.config,
      .busy             = entry.lock.isHeld(),
    };
  }
} // namespace plm::core::plugin

#include <Plm/Core/InstallOrchestrator.hpp>

#include <Plm/Core/Validator.hpp>
#include <Plm/Utils/Logging.hpp>

namespace plm::core::plugin {
  using namespace utils::types;

  namespace {
    using Task = std::future<Result<OperationOutcome>>;

    fn ReportFinished(Task& task) -> Unit {
      try {
        if (const Result<OperationOutcome> result = task.get(); result)
          debug_log("Abandoned operation on '{}' finished: {} -> {}", result->plugin, StateName(result->previous), StateName(result->current));
        else
          warn_log("Abandoned operation finished with an error: {}", result.error().message);
      } catch (const Exception& e) {
        error_log("Abandoned operation threw: {}", e.what());
      } catch (...) {
        error_log("Abandoned operation threw a non-standard exception");
      }
    }
  } // namespace

  InstallOrchestrator::InstallOrchestrator(PluginRegistry& registry, const Option<std::chrono::milliseconds> defaultTimeout)
    : m_registry(registry), m_defaultTimeout(defaultTimeout) {}

  InstallOrchestrator::~InstallOrchestrator() {
    drain();
  }

  fn InstallOrchestrator::setDefaultTimeout(const Option<std::chrono::milliseconds> timeout) -> Unit {
    const LockGuard lock(m_mutex);
    m_defaultTimeout = timeout;
  }

  fn InstallOrchestrator::setValidateOnInstall(const bool enabled) -> Unit {
    const LockGuard lock(m_mutex);
    m_validateOnInstall = enabled;
  }

  fn InstallOrchestrator::installPlugin(const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome> {
    return run(Action::Install, name, version, options);
  }

  fn InstallOrchestrator::uninstallPlugin(const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome> {
    return run(Action::Uninstall, name, version, options);
  }

  fn InstallOrchestrator::run(const Action action, const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome> {
    const StringView verb = action == Action::Install ? "install" : "uninstall";

    const String declared        = TRY(m_registry.declaredVersion(name));
    const bool   explicitVersion = version && !version->empty();

    Option<std::chrono::milliseconds> timeout = options.timeout;
    bool                              validate = false;

    {
      const LockGuard lock(m_mutex);

      if (!timeout)
        timeout = m_defaultTimeout;

      validate = m_validateOnInstall && action == Action::Install;
    }

    // One deadline covers both the wait for the lock and the hook.
    Option<std::chrono::steady_clock::time_point> deadline;

    if (timeout)
      deadline = std::chrono::steady_clock::now() + *timeout;

    OperationGuard guard = TRY(m_registry.lockPlugin(name, deadline));

    String resolved = explicitVersion ? *version : declared;

    if (!explicitVersion && action == Action::Uninstall)
      if (Option<String> installed = m_registry.installedVersion(guard))
        resolved = std::move(*installed);

    OperationTrace trace(name, options.verbose);

    trace.record("lock acquired for {} {}", verb, resolved);

    if (validate) {
      const Vec<String> problems = Validator::checkEntry(m_registry.describe(guard));

      if (!problems.empty()) {
        String details;

        for (const String& problem : problems) {
          if (!details.empty())
            details += "; ";

          details += problem;
        }

        trace.record("validation failed: {}", details);
        ERR_FMT(ValidationFailed, "Plugin '{}' failed validation before install: {}", name, details);
      }
    }

    auto transition = [this, action, resolved, options](OperationGuard& held, OperationTrace& steps) -> Result<OperationOutcome> {
      if (action == Action::Install)
        return m_registry.installLocked(held, resolved, options, steps);

      return m_registry.uninstallLocked(held, resolved, options, steps);
    };

    // A dry run never reaches a hook, so there is nothing to wait for.
    if (!deadline || options.dryRun)
      return transition(guard, trace);

    Task task = std::async(
      std::launch::async,
      [transition, held = std::move(guard), steps = std::move(trace)]() mutable -> Result<OperationOutcome> {
        Result<OperationOutcome> result = transition(held, steps);
        held.release();
        return result;
      }
    );

    if (task.wait_until(*deadline) == std::future_status::ready)
      return task.get();

    warn_log("Plugin '{}' did not {} within {}ms; the operation continues in the background", name, verb, timeout->count());
    abandon(std::move(task));

    ERR_FMT(Timeout, "Timed out after {}ms waiting for plugin '{}' to {} {}", timeout->count(), name, verb, resolved);
  }

  fn InstallOrchestrator::abandon(Task task) -> Unit {
    pruneFinished();

    const LockGuard lock(m_mutex);
    m_background.push_back(std::move(task));
  }

  fn InstallOrchestrator::pruneFinished() -> Unit {
    Vec<Task> finished;

    {
      const LockGuard lock(m_mutex);

      for (auto iter = m_background.begin(); iter != m_background.end();)
        if (iter->wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
          finished.push_back(std::move(*iter));
          iter = m_background.erase(iter);
        } else
          ++iter;
    }

    for (Task& task : finished)
      ReportFinished(task);
  }

  fn InstallOrchestrator::pendingCount() -> usize {
    pruneFinished();

    const LockGuard lock(m_mutex);
    return m_background.size();
  }

  fn InstallOrchestrator::drain() -> Unit {
    Vec<Task> pending;

    {
      const LockGuard lock(m_mutex);
      pending.swap(m_background);
    }

    if (!pending.empty())
      debug_log("Waiting for {} abandoned operation(s)", pending.size());

    for (Task& task : pending)
      ReportFinished(task);
  }
} // namespace plm::core::plugin

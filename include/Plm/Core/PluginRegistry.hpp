/**
 * @file PluginRegistry.hpp
 * @brief Name -> plugin entry mapping and the lifecycle state machine
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Two levels of locking:
 * - A registry-wide shared mutex guards the map and every entry's fields. It is
 *   only ever held for a lookup or a field write, never across a plugin hook.
 * - Each entry carries an OperationLock. A lifecycle operation holds it for the
 *   whole read-state -> hook -> write-state sequence, so a plugin never has two
 *   operations in flight. Different plugins never wait on each other.
 *
 * The *Locked methods take an OperationGuard as proof that the caller owns the
 * entry's lock; lockPlugin() is the only way to obtain one.
 */

#pragma once

#include <chrono>     // std::chrono::{milliseconds, steady_clock}
#include <filesystem> // std::filesystem::path
#include <format>     // std::format_string
#include <utility>    // std::forward

#include "../Config/ProjectConfig.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Lifecycle.hpp"
#include "OperationLock.hpp"
#include "Plugin.hpp"

namespace plm::core::plugin {
  namespace fs = std::filesystem;

  using utils::error::PlmError;
  using utils::types::Fn;
  using utils::types::Map;
  using utils::types::Option;
  using utils::types::Result;
  using utils::types::SharedPointer;
  using utils::types::String;
  using utils::types::Unit;
  using utils::types::Vec;

  /**
   * @struct PluginEntry
   * @brief One registry row. Fields are only touched under the registry mutex.
   */
  struct PluginEntry {
    String                       name;
    PluginMetadata               metadata;
    SharedPointer<IPlugin>       instance;
    LifecycleState               state = LifecycleState::Unregistered;
    Option<config::PluginConfig> config;
    Option<String>               installedVersion;
    OperationLock                lock;
  };

  /**
   * @class OperationGuard
   * @brief Move-only ownership of one entry's OperationLock.
   */
  class OperationGuard {
   public:
    OperationGuard() = default;
    explicit OperationGuard(SharedPointer<PluginEntry> entry) : m_entry(std::move(entry)) {}

    OperationGuard(const OperationGuard&)                = delete;
    fn operator=(const OperationGuard&)->OperationGuard& = delete;

    OperationGuard(OperationGuard&& other) noexcept : m_entry(std::move(other.m_entry)) {}

    fn operator=(OperationGuard&& other) noexcept -> OperationGuard& {
      if (this != &other) {
        release();
        m_entry = std::move(other.m_entry);
      }
      return *this;
    }

    ~OperationGuard() {
      release();
    }

    fn release() -> void {
      if (m_entry) {
        m_entry->lock.release();
        m_entry.reset();
      }
    }

    [[nodiscard]] fn ownsLock() const -> bool {
      return m_entry != nullptr;
    }

    [[nodiscard]] fn entry() const -> PluginEntry& {
      return *m_entry;
    }

    [[nodiscard]] fn name() const -> const String& {
      return m_entry->name;
    }

   private:
    SharedPointer<PluginEntry> m_entry;
  };

  /**
   * @class OperationTrace
   * @brief Step log for verbose operations; a no-op when disabled.
   */
  class OperationTrace {
   public:
    OperationTrace(String plugin, const bool enabled) : m_plugin(std::move(plugin)), m_enabled(enabled) {}

    template <typename... Args>
    fn record(std::format_string<Args...> fmt, Args&&... args) -> void {
      if (!m_enabled)
        return;

      String step = std::format(fmt, std::forward<Args>(args)...);
      info_log("[{}] {}", m_plugin, step);
      m_steps.push_back(std::move(step));
    }

    [[nodiscard]] fn enabled() const -> bool {
      return m_enabled;
    }

    fn take() -> Vec<String> {
      return std::move(m_steps);
    }

   private:
    String      m_plugin;
    bool        m_enabled;
    Vec<String> m_steps;
  };

  /**
   * @struct OperationOutcome
   * @brief Success value of a lifecycle operation.
   */
  struct OperationOutcome {
    String         plugin;
    LifecycleState previous = LifecycleState::Unregistered;
    LifecycleState current  = LifecycleState::Unregistered;
    Option<String> descriptor;     ///< Set by install (real or dry run).
    bool           dryRun = false; ///< Nothing was invoked, nothing changed.
    Vec<String>    trace;          ///< Filled in verbose mode.

    [[nodiscard]] fn stateChanged() const -> bool {
      return previous != current;
    }
  };

  struct PluginFailure {
    String   plugin;
    PlmError error;
  };

  /**
   * @struct PluginInfo
   * @brief Read-only snapshot of an entry, as returned by listings.
   */
  struct PluginInfo {
    String                       name;
    PluginMetadata               metadata;
    LifecycleState               state = LifecycleState::Unregistered;
    Option<String>               installedVersion;
    Option<config::PluginConfig> config;
    bool                         busy = false; ///< An operation currently holds the entry's lock.
  };

  class PluginRegistry {
   public:
    using StateObserver = Fn<void(const String& name, LifecycleState from, LifecycleState target)>;

    explicit PluginRegistry(ContentionPolicy policy = ContentionPolicy::Queue);

    PluginRegistry(const PluginRegistry&)                = delete;
    PluginRegistry(PluginRegistry&&)                     = delete;
    fn operator=(const PluginRegistry&)->PluginRegistry& = delete;
    fn operator=(PluginRegistry&&)->PluginRegistry&      = delete;
    ~PluginRegistry()                                    = default;

    fn setContentionPolicy(ContentionPolicy policy) -> Unit;
    [[nodiscard]] fn contentionPolicy() const -> ContentionPolicy;

    fn setProjectRoot(fs::path root) -> Unit;

    /// Called after every state change, outside the registry mutex but inside the entry's lock.
    fn setStateObserver(StateObserver observer) -> Unit;

    /**
     * @brief Unregistered -> Registered.
     * @details A terminal (Shutdown) entry under the same name is replaced.
     * @return AlreadyRegistered if an active entry uses the name.
     */
    fn registerPlugin(const String& name, SharedPointer<IPlugin> capability, Option<config::PluginConfig> config = None) -> Result<OperationOutcome>;

    /**
     * @brief Removes an entry: Registered entries are dropped directly, Initialized
     *        and Installed ones are shut down first.
     */
    fn unregisterPlugin(const String& name) -> Result<OperationOutcome>;

    /**
     * @brief Looks the entry up and takes its operation lock, honouring the contention policy.
     * @param deadline Stop waiting in the queue at this point; None waits forever.
     * @return NotFound if there is no entry, InvalidState if busy under ContentionPolicy::Reject,
     *         Timeout if the deadline passed while queued.
     */
    fn lockPlugin(const String& name, Option<std::chrono::steady_clock::time_point> deadline = None) -> Result<OperationGuard>;

    fn initializeOne(const String& name, bool verbose = false) -> Result<OperationOutcome>;
    fn shutdownOne(const String& name, bool verbose = false) -> Result<OperationOutcome>;

    fn initializeLocked(OperationGuard& guard, OperationTrace& trace) -> Result<OperationOutcome>;
    fn installLocked(OperationGuard& guard, const String& version, const InstallOptions& options, OperationTrace& trace) -> Result<OperationOutcome>;
    fn uninstallLocked(OperationGuard& guard, const String& version, const InstallOptions& options, OperationTrace& trace) -> Result<OperationOutcome>;
    fn shutdownLocked(OperationGuard& guard, OperationTrace& trace) -> Result<OperationOutcome>;

    /**
     * @brief Shuts down every non-terminal entry, waiting for in-flight operations.
     * @details Registered entries are dropped without a hook call. One plugin's
     *          failure does not stop the others.
     * @param lockTimeout How long to wait for each plugin's in-flight operation;
     *        a plugin still busy after that is reported as a Timeout failure.
     * @return The failures, in the order they happened.
     */
    fn shutdownAll(Option<std::chrono::milliseconds> lockTimeout = None) -> Vec<PluginFailure>;

    /// Snapshot of the locked entry.
    [[nodiscard]] fn describe(const OperationGuard& guard) const -> PluginInfo;

    /// The version recorded by the last successful install, if any.
    [[nodiscard]] fn installedVersion(const OperationGuard& guard) const -> Option<String>;

    /// Replaces (or clears) the config attached to an entry.
    fn attachConfig(const String& name, Option<config::PluginConfig> config) -> Result<Unit>;

    [[nodiscard]] fn contains(const String& name) const -> bool;
    [[nodiscard]] fn isActive(const String& name) const -> bool;
    [[nodiscard]] fn stateOf(const String& name) const -> Option<LifecycleState>;
    [[nodiscard]] fn declaredVersion(const String& name) const -> Result<String>;
    [[nodiscard]] fn getPluginConfig(const String& name) const -> Option<config::PluginConfig>;

    /// Active (non-terminal) entries, sorted by name.
    [[nodiscard]] fn listPlugins() const -> Vec<PluginInfo>;

    /// Every entry including shut-down ones kept for auditing.
    [[nodiscard]] fn listAll() const -> Vec<PluginInfo>;

    [[nodiscard]] fn activeCount() const -> utils::types::usize;

   private:
    fn find(const String& name) const -> SharedPointer<PluginEntry>;
    fn acquire(const SharedPointer<PluginEntry>& entry, ContentionPolicy policy, Option<std::chrono::steady_clock::time_point> deadline = None) -> Result<OperationGuard>;
    fn readState(const PluginEntry& entry) const -> LifecycleState;
    fn readInstance(const PluginEntry& entry) const -> SharedPointer<IPlugin>;
    fn commitState(PluginEntry& entry, LifecycleState target) -> Result<Unit>;
    fn erase(const SharedPointer<PluginEntry>& entry) -> Unit;
    fn snapshot(const PluginEntry& entry) const -> PluginInfo;
    fn notify(const String& name, LifecycleState from, LifecycleState target) -> Unit;

    mutable utils::types::SharedMutex       m_mutex;
    Map<String, SharedPointer<PluginEntry>> m_entries;
    ContentionPolicy                        m_policy;
    fs::path                                m_projectRoot;

    utils::types::Mutex m_observerMutex;
    StateObserver       m_observer;
  };
} // namespace plm::core::plugin

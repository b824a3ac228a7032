/**
 * @file InstallOrchestrator.hpp
 * @brief Install/uninstall with per-plugin serialization and caller timeouts
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Every call follows the same path: resolve the version, take the
 * plugin's operation lock, run the registry transition, release the lock.
 *
 * When a timeout applies, the transition runs as a std::async task that owns
 * the lock. If the caller stops waiting it gets a Timeout error, but the task
 * carries on: the hook finishes, the state is written, then the lock is
 * released. Abandoned tasks are kept and joined by drain(). There is no hard
 * cancel.
 *
 * The timeout bounds the whole call: time spent queued for the plugin's lock
 * counts against it. A caller whose deadline passes while still queued gets
 * Timeout and nothing runs on its behalf.
 *
 * With validate-on-install enabled, an install is refused with
 * ValidationFailed when Validator::checkEntry finds a problem with the entry.
 */

#pragma once

#include <chrono> // std::chrono::milliseconds
#include <future> // std::future

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "PluginRegistry.hpp"

namespace plm::core::plugin {
  class InstallOrchestrator {
   public:
    explicit InstallOrchestrator(PluginRegistry& registry, Option<std::chrono::milliseconds> defaultTimeout = None);

    InstallOrchestrator(const InstallOrchestrator&)                = delete;
    InstallOrchestrator(InstallOrchestrator&&)                     = delete;
    fn operator=(const InstallOrchestrator&)->InstallOrchestrator& = delete;
    fn operator=(InstallOrchestrator&&)->InstallOrchestrator&      = delete;

    /// Waits for every abandoned operation.
    ~InstallOrchestrator();

    fn setDefaultTimeout(Option<std::chrono::milliseconds> timeout) -> Unit;

    fn setValidateOnInstall(bool enabled) -> Unit;

    /**
     * @brief Installs a plugin.
     * @param name Registered plugin name.
     * @param version Version to install; the plugin's declared version when omitted or empty.
     * @param options force / dryRun / verbose / timeout.
     * @return The transition, or NotFound, InvalidArgument, InvalidState, InstallFailed,
     *         ValidationFailed, Timeout.
     */
    fn installPlugin(const String& name, const Option<String>& version = None, const InstallOptions& options = {}) -> Result<OperationOutcome>;

    /**
     * @brief Uninstalls a plugin.
     * @details An omitted version means the installed one, or the declared one
     *          when nothing is installed.
     * @return The transition, or NotFound, InvalidArgument, InvalidState, UninstallFailed, Timeout.
     */
    fn uninstallPlugin(const String& name, const Option<String>& version = None, const InstallOptions& options = {}) -> Result<OperationOutcome>;

    /// Blocks until every operation abandoned by a timed-out caller has finished.
    fn drain() -> Unit;

    /// Abandoned operations still running.
    [[nodiscard]] fn pendingCount() -> utils::types::usize;

   private:
    enum class Action : utils::types::u8 {
      Install,
      Uninstall,
    };

    fn run(Action action, const String& name, const Option<String>& version, const InstallOptions& options) -> Result<OperationOutcome>;
    fn abandon(std::future<Result<OperationOutcome>> task) -> Unit;
    fn pruneFinished() -> Unit;

    PluginRegistry& m_registry;

    utils::types::Mutex                        m_mutex;
    Option<std::chrono::milliseconds>          m_defaultTimeout;
    bool                                       m_validateOnInstall = false;
    Vec<std::future<Result<OperationOutcome>>> m_background;
  };
} // namespace plm::core::plugin

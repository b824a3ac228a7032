#pragma once

#include "../Utils/Types.hpp"

namespace plm::core::plugin {
  /**
   * @enum LifecycleState
   * @brief Where a registry entry is in its lifecycle.
   *
   * Unregistered -> Registered -> Initialized <-> Installed, then
   * Initialized/Installed -> ShuttingDown -> Shutdown. Unregistered and
   * Shutdown are terminal: the entry has to be registered again to be used.
   */
  enum class LifecycleState : utils::types::u8 {
    Unregistered,
    Registered,
    Initialized,
    Installed,
    ShuttingDown,
    Shutdown,
  };

  /**
   * @brief Whether the state machine allows moving an entry from one state to another.
   * @details Installed -> Installed (a forced reinstall) is the only self transition.
   *          ShuttingDown -> Initialized/Installed is the rollback taken when a
   *          shutdown hook fails.
   */
  fn IsTransitionAllowed(LifecycleState from, LifecycleState target) -> bool;

  fn IsTerminal(LifecycleState state) -> bool;

  /// True for every enumerator; false for values cast in from outside the enum.
  fn IsDefinedState(LifecycleState state) -> bool;

  fn StateName(LifecycleState state) -> utils::types::StringView;
} // namespace plm::core::plugin

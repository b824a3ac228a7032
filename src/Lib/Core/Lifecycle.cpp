#include <Plm/Core/Lifecycle.hpp>

#include <magic_enum/magic_enum.hpp>
#include <matchit.hpp>

namespace plm::core::plugin {
  fn IsTransitionAllowed(const LifecycleState from, const LifecycleState target) -> bool {
    using matchit::match, matchit::is, matchit::ds, matchit::or_, matchit::_;
    using enum LifecycleState;

    return match(from, target)(
      is | ds(Unregistered, Registered)                  = true,
      is | ds(Registered, Initialized)                   = true,
      is | ds(Registered, Unregistered)                  = true,
      is | ds(Initialized, Installed)                    = true,
      is | ds(Installed, or_(Installed, Initialized))    = true,
      is | ds(or_(Initialized, Installed), ShuttingDown) = true,
      is | ds(ShuttingDown, Shutdown)                    = true,
      is | ds(ShuttingDown, or_(Initialized, Installed)) = true,
      is | _                                             = false
    );
  }

  fn IsTerminal(const LifecycleState state) -> bool {
    return state == LifecycleState::Unregistered || state == LifecycleState::Shutdown;
  }

  fn IsDefinedState(const LifecycleState state) -> bool {
    return magic_enum::enum_contains(state);
  }

  fn StateName(const LifecycleState state) -> utils::types::StringView {
    const utils::types::StringView name = magic_enum::enum_name(state);
    return name.empty() ? "Undefined" : name;
  }
} // namespace plm::core::plugin

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "PluginRegistry.hpp"

namespace plm::core::plugin {
  struct ValidationFailure {
    String plugin;
    String reason;
  };

  /**
   * @struct ValidationSummary
   * @brief Result of checking every registry entry.
   * @details An entry with several problems counts once in invalidPlugins but
   *          contributes one failure per problem.
   */
  struct ValidationSummary {
    utils::types::usize    validPlugins   = 0;
    utils::types::usize    invalidPlugins = 0;
    Vec<ValidationFailure> failures;

    [[nodiscard]] fn isAllValid() const -> bool {
      return invalidPlugins == 0;
    }

    [[nodiscard]] fn totalPlugins() const -> utils::types::usize {
      return validPlugins + invalidPlugins;
    }

    /// ValidationFailed listing every failure, or success when all entries are valid.
    [[nodiscard]] fn toResult() const -> Result<Unit>;
  };

  /**
   * @class Validator
   * @brief Structural checks over the registry. Read-only; safe to run at any time.
   */
  class Validator {
   public:
    explicit Validator(const PluginRegistry& registry) : m_registry(registry) {}

    [[nodiscard]] fn validateAll() const -> ValidationSummary;

    /// Every problem found with one entry; empty when it is valid.
    static fn checkEntry(const PluginInfo& info) -> Vec<String>;

   private:
    const PluginRegistry& m_registry;
  };
} // namespace plm::core::plugin

#include <Plm/Core/Validator.hpp>

#include <Plm/Utils/Logging.hpp>
#include <Plm/Utils/Version.hpp>

namespace plm::core::plugin {
  using namespace utils::types;
  using utils::version::IsValidSemver;

  fn ValidationSummary::toResult() const -> Result<Unit> {
    if (isAllValid())
      return {};

    String details;

    for (const ValidationFailure& failure : failures) {
      if (!details.empty())
        details += "; ";

      details += std::format("{}: {}", failure.plugin, failure.reason);
    }

    ERR_FMT(ValidationFailed, "{} of {} plugin(s) failed validation: {}", invalidPlugins, totalPlugins(), details);
  }

  fn Validator::checkEntry(const PluginInfo& info) -> Vec<String> {
    Vec<String> reasons;

    if (info.metadata.name.empty())
      reasons.emplace_back("metadata name is empty");
    else if (info.metadata.name != info.name)
      reasons.push_back(std::format("metadata name '{}' does not match registered name '{}'", info.metadata.name, info.name));

    if (!IsValidSemver(info.metadata.version))
      reasons.push_back(std::format("version '{}' is not a valid semantic version", info.metadata.version));

    if (info.metadata.minPlmVersion && !IsValidSemver(*info.metadata.minPlmVersion))
      reasons.push_back(std::format("minimum manager version '{}' is not a valid semantic version", *info.metadata.minPlmVersion));

    if (info.config && info.config->name != info.name)
      reasons.push_back(std::format("attached config is for '{}'", info.config->name));

    if (!IsDefinedState(info.state))
      reasons.push_back(std::format("state {} is not a lifecycle state", static_cast<u32>(info.state)));

    return reasons;
  }

  fn Validator::validateAll() const -> ValidationSummary {
    ValidationSummary summary;

    for (const PluginInfo& info : m_registry.listAll()) {
      Vec<String> reasons = checkEntry(info);

      if (reasons.empty()) {
        ++summary.validPlugins;
        continue;
      }

      ++summary.invalidPlugins;

      for (String& reason : reasons) {
        debug_log("Plugin '{}' failed validation: {}", info.name, reason);
        summary.failures.push_back({ info.name, std::move(reason) });
      }
    }

    return summary;
  }
} // namespace plm::core::plugin

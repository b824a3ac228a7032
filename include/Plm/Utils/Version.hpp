#pragma once

#include "Types.hpp"

namespace plm::utils::version {
  /**
   * @brief Checks that a string is a semantic version (MAJOR.MINOR.PATCH[-pre][+build]).
   * @details Numeric parts must not carry leading zeros; pre-release and build
   *          identifiers are dot-separated runs of [0-9A-Za-z-].
   * @param version The candidate version string.
   * @return true when the string is well-formed.
   */
  fn IsValidSemver(types::StringView version) -> bool;
} // namespace plm::utils::version

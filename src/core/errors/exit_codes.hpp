#pragma once

namespace camlink::core::errors {

// Process-exit contract for the `camlink` CLI.
//
// 0/1/2 keep their conventional meanings; the rest let wrappers branch on
// the failure class without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kExpectationsFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camlink::core::errors

#ifndef CAMLINK_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CAMLINK_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "camlink/cli/router.hpp"

#include <string>
#include <vector>

namespace camlink::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return camlink::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace camlink::tests::common

#endif // CAMLINK_TESTS_COMMON_CLI_DISPATCH_HPP_

#pragma once

namespace camlink::cli {

// Routes `camlink` subcommands. Exit codes follow core::errors::ExitCode:
//   0  success
//   1  command failed after valid invocation
//   2  usage error
//   10 configuration or simulation plan invalid
//   30 simulation ran but its expectations failed
int Dispatch(int argc, char** argv);

} // namespace camlink::cli

#pragma once
#include <ostream>

#include "core/config/Config.hpp"

namespace vf {

// Exit codes of the `vaultflow` command.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;    // unknown command or bad arguments
inline constexpr int kExitFatal = 2;
inline constexpr int kExitRefused = 3;  // the store said no (StoreError, lost claim, not executable)

// Runs one command over the vault named by cfg. argv[1] is the command.
// Results go to `out`, diagnostics to `err`.
int run_cli(int argc, char** argv, const Config& cfg, std::ostream& out, std::ostream& err);

} // namespace vf

#pragma once
#include <string>

namespace vf {

struct Config;

// Installs the default spdlog logger: colored console plus a rotating file
// under <vault>/Logs/vaultflow.log (5 MiB x 3). Unknown levels fall back to info.
void init_logging(const Config& cfg, const std::string& name = "vaultflow");

} // namespace vf

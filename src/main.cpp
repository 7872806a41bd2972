// src/main.cpp
#include <iostream>

#include "core/config/Config.hpp"
#include "core/logging/Logging.hpp"
#include "services/cli/Cli.hpp"

int main(int argc, char** argv) {
  vf::Config cfg;
  try {
    cfg = vf::load_config();
    vf::init_logging(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return vf::kExitFatal;
  }
  return vf::run_cli(argc, argv, cfg, std::cout, std::cerr);
}

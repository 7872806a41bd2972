// src/server_main.cpp
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/logging/Logging.hpp"
#include "core/storage/StoreError.hpp"
#include "services/api/HttpServer.hpp"
#include "services/runtime/Runtime.hpp"

int main() {
  try {
    vf::Config cfg = vf::load_config();
    vf::init_logging(cfg, "vaultflow-server");

    // Self-heal layout and DB on startup (idempotent)
    vf::Runtime rt(cfg);

    std::unique_ptr<vf::DashboardAggregator> dashboard;
    try {
      dashboard = rt.openDashboard(cfg.dashboard_role);
    } catch (const vf::StoreError& e) {
      if (e.code() != vf::ErrorCode::AlreadyClaimed) throw;
      spdlog::warn("{}; serving the dashboard as a contributor", e.what());
      dashboard = rt.openDashboard(vf::DashboardRole::Contributor);
    }

    vf::run_http_server(rt, *dashboard, cfg.port, cfg.api_key);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}

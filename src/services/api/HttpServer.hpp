#pragma once
#include <string>

namespace vf {

class Runtime;
class DashboardAggregator;

// Start a blocking HTTP server over one vault: read-only views of the
// collections, ledger and dashboard, delta submission and human
// approve/reject. apiKey: if empty, auth is disabled.
void run_http_server(Runtime& rt,
                     DashboardAggregator& dashboard,
                     int port,
                     const std::string& apiKey);

} // namespace vf

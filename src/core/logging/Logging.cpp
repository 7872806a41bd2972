#include "Logging.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/config/Config.hpp"
#include "core/storage/Collections.hpp"

namespace fs = std::filesystem;

namespace vf {

void init_logging(const Config& cfg, const std::string& name) {
  std::vector<spdlog::sink_ptr> sinks;
  // console goes to stderr so command output on stdout stays clean
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  const fs::path logDir = fs::path(cfg.vault_path) / kLogsDir;
  std::error_code ec;
  fs::create_directories(logDir, ec);
  bool fileSink = !ec;
  if (fileSink) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      (logDir / (name + ".log")).string(), 5 * 1024 * 1024, 3));
  }

  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] [%P] %v");

  auto level = spdlog::level::from_str(cfg.log_level);
  bool unknownLevel = level == spdlog::level::off && cfg.log_level != "off";
  if (unknownLevel) level = spdlog::level::info;
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!fileSink) spdlog::warn("file logging disabled: cannot create {}: {}", logDir.string(), ec.message());
  if (unknownLevel) spdlog::warn("unknown log level '{}', using info", cfg.log_level);
}

} // namespace vf

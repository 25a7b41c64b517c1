// src/Logging.cpp
#include "Subtitler/Logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/async.h>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <vector>

namespace logsys {

void init(bool verbose, const std::string& logDir) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
      spdlog::warn("Cannot create log directory '{}': {}", logDir, ec.message());
    } else {
      auto file = (std::filesystem::path(logDir) / "subtitler.log").string();
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 5 * 1024 * 1024, 3));
      } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("File logging disabled: {}", e.what());
      }
    }
  }

  // Async logger so SDK and capture threads never block on the console
  spdlog::init_thread_pool(8192, 1);
  auto logger = std::make_shared<spdlog::async_logger>(
      "subtitler", sinks.begin(), sinks.end(),
      spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  // Pattern. Time, level, thread, logger name
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(1));
  spdlog::enable_backtrace(32);
}

std::shared_ptr<spdlog::logger> get() { return spdlog::default_logger(); }

std::shared_ptr<spdlog::logger> component(const std::string& name) {
  auto base = spdlog::default_logger();
  auto child = base->clone(name);
  child->set_level(spdlog::get_level());
  return child;
}

void shutdown() { spdlog::shutdown(); }

} // namespace logsys

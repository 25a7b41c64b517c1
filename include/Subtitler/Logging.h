// include/Subtitler/Logging.h
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logsys {
// Console sink always; rotating file sink when logDir is non-empty.
void init(bool verbose = false, const std::string& logDir = "");
std::shared_ptr<spdlog::logger> get();
// Child logger sharing the default logger's sinks, named after a component.
std::shared_ptr<spdlog::logger> component(const std::string& name);
void shutdown();
}

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <cstdio>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace netdash {
namespace util {

namespace {

const char* const kComponents[] = {"default", "discovery", "probe", "config"};

std::once_flag g_init_flag;
std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_shutdown = false;

void CreateLoggers(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  // Logs go to stderr so CLI stdout stays pure JSON.
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      fprintf(stderr, "netdash: cannot open log file %s: %s\n", log_file_path.c_str(), e.what());
    }
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    g_loggers[name] = logger;
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, [&]() {
    std::lock_guard<std::mutex> lock(g_mutex);
    CreateLoggers(log_level, log_to_file, log_file_path);
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_shutdown = true;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_shutdown && g_loggers.empty()) {
    CreateLoggers("info", false, "");
    g_shutdown = false;
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  Initialize();
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto lvl = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  Initialize();
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace netdash

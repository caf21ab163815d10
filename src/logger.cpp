#include "logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

Logger::Logger()
    : logger_(std::make_shared<spdlog::logger>("splitview", std::make_shared<spdlog::sinks::null_sink_mt>())) {
  logger_->set_level(spdlog::level::off);
}

Logger& Logger::get() {
  static Logger instance;
  return instance;
}

bool Logger::init(const std::string& path, spdlog::level::level_enum level, std::string& msg) {
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    sink->set_pattern("[%H:%M:%S.%e] [%l] %s:%# %v");
    auto lg = std::make_shared<spdlog::logger>("splitview", sink);
    lg->set_level(level);
    lg->flush_on(spdlog::level::warn);
    logger_ = std::move(lg);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + path + " (" + e.what() + ")";
    return false;
  }
  msg = std::string("logging to ") + path;
  return true;
}

void Logger::shutdown() {
  if (logger_) logger_->flush();
}

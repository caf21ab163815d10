#pragma once
/*
 * Logger
 *
 * Purpose: process-wide spdlog logger; file sink only, ncurses owns the tty.
 * Usage: Logger::get().init(path, level) once in main, then LOG_INFO(...).
 *        Without init every message goes to a null sink.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
  static Logger& get();
  bool init(const std::string& path, spdlog::level::level_enum level, std::string& msg);
  void shutdown();
  spdlog::logger* raw() const { return logger_.get(); }

private:
  Logger();
  std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(Logger::get().raw(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(Logger::get().raw(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(Logger::get().raw(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(Logger::get().raw(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(Logger::get().raw(), __VA_ARGS__)

#include "terminal.hpp"
#include "workbench.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <filesystem>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [--layout <file>] [--log <file>] [files...]\n", argv0);
}

int main(int argc, char** argv) {
  std::vector<std::filesystem::path> files;
  std::optional<std::filesystem::path> layout;
  std::optional<std::string> log_path;
  if (const char* env = std::getenv("SPLITVIEW_LOG")) log_path = std::string(env);
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) { usage(argv[0]); return 0; }
    if (std::strcmp(argv[i], "--layout") == 0 || std::strcmp(argv[i], "--log") == 0) {
      if (i + 1 >= argc) { usage(argv[0]); return 2; }
      bool is_layout = std::strcmp(argv[i], "--layout") == 0;
      ++i;
      if (is_layout) layout = std::filesystem::path(argv[i]);
      else log_path = std::string(argv[i]);
      continue;
    }
    files.emplace_back(argv[i]);
  }
  if (log_path) {
    std::string msg;
    if (!Logger::get().init(*log_path, spdlog::level::debug, msg)) std::fprintf(stderr, "%s\n", msg.c_str());
  }
  {
    Terminal term;
    Workbench wb(files, layout);
    wb.run();
  }
  Logger::get().shutdown();
  return 0;
}

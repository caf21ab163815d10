#pragma once
/*
 * Document
 *
 * Purpose: read-only text content shown inside a panel.
 * Note: owned by the workbench; panels only hold a ContentHandle to it.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct Document {
  std::vector<std::string> lines;
  std::optional<std::filesystem::path> path;

  int line_count() const { return static_cast<int>(lines.size()); }
  int max_width() const;
  std::string name() const;

  static std::optional<Document> from_file(const std::filesystem::path& path, std::string& msg);
  static Document from_text(const std::string& text);
};

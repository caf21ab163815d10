#include "document.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <sstream>

int Document::max_width() const {
  size_t w = 0;
  for (const auto& l : lines) w = std::max(w, l.size());
  return static_cast<int>(w);
}

std::string Document::name() const {
  return path ? path->filename().string() : std::string("[scratch]");
}

std::optional<Document> Document::from_file(const std::filesystem::path& path, std::string& msg) {
  Document d;
  if (!mmapReadLines(path, d.lines, msg)) return std::nullopt;
  d.path = path;
  return d;
}

Document Document::from_text(const std::string& text) {
  Document d;
  std::istringstream iss(text);
  std::string l;
  while (std::getline(iss, l)) d.lines.push_back(l);
  if (d.lines.empty()) d.lines.emplace_back("");
  return d;
}

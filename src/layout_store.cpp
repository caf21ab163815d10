#include "layout_store.hpp"
#include "file_reader.hpp"
#include "logger.hpp"
#include "posix_fd.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fcntl.h>
#include <sstream>

static std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && std::isspace((unsigned char)s[j - 1])) j--;
  return s.substr(i, j - i);
}

std::string format_layout(const SplitView& view) {
  std::ostringstream oss;
  oss << "# splitview layout\n";
  oss << "orientation " << orientation_name(view.orientation()) << "\n";
  oss << "sync " << (view.sync_scrolling() ? "on" : "off") << "\n";
  oss.precision(17);
  for (const auto& p : view.registry().panels()) {
    oss << "panel " << p.size;
    if (p.title) oss << " " << *p.title;
    oss << "\n";
  }
  return oss.str();
}

bool parse_layout(const std::string& text, const LayoutOptions& opts, SavedLayout& out, std::string& msg) {
  SavedLayout parsed;
  std::istringstream in(text);
  std::string raw;
  int lineno = 0;
  while (std::getline(in, raw)) {
    ++lineno;
    std::string s = trim(raw);
    if (s.empty() || s[0] == '#') continue;
    std::istringstream ls(s);
    std::string key; ls >> key;
    std::string where = "line " + std::to_string(lineno) + ": ";
    if (key == "orientation") {
      std::string v; ls >> v;
      if (v == "horizontal") parsed.orientation = Orientation::Horizontal;
      else if (v == "vertical") parsed.orientation = Orientation::Vertical;
      else { msg = where + "bad orientation '" + v + "'"; return false; }
    } else if (key == "sync") {
      std::string v; ls >> v;
      if (v == "on") parsed.sync = true;
      else if (v == "off") parsed.sync = false;
      else { msg = where + "sync must be on|off"; return false; }
    } else if (key == "panel") {
      std::string num; ls >> num;
      char* end = nullptr;
      double size = std::strtod(num.c_str(), &end);
      if (num.empty() || end == nullptr || *end != '\0' || !std::isfinite(size)) {
        msg = where + "bad panel size '" + num + "'";
        return false;
      }
      std::string rest; std::getline(ls, rest);
      rest = trim(rest);
      PanelSnapshot snap;
      snap.size = size;
      if (!rest.empty()) snap.title = rest;
      parsed.panels.push_back(std::move(snap));
    } else {
      msg = where + "unknown directive '" + key + "'";
      return false;
    }
  }
  int n = static_cast<int>(parsed.panels.size());
  if (n < 1) { msg = "layout has no panels"; return false; }
  if (n > opts.max_panels) { msg = "layout has " + std::to_string(n) + " panels, max is " + std::to_string(opts.max_panels); return false; }
  double total = 0.0;
  for (const auto& p : parsed.panels) {
    if (p.size + SV_SIZE_EPSILON < opts.min_size) { msg = "panel size below minimum"; return false; }
    total += p.size;
  }
  if (std::fabs(total - 100.0) > 0.01) { msg = "panel sizes must sum to 100"; return false; }
  out = std::move(parsed);
  return true;
}

bool save_layout(const std::filesystem::path& path, const SplitView& view, std::string& msg) {
  // never write a file parse_layout would reject
  if (std::fabs(view.registry().total() - 100.0) > 0.01) {
    msg = "layout not saved: panel sizes must sum to 100";
    LOG_WARN("refusing to save layout with total {:.4f}", view.registry().total());
    return false;
  }
  std::string data = format_layout(view);
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) { msg = std::string("can not write layout: ") + tmp.string(); return false; }
  const char* p = data.data();
  size_t remain = data.size();
  while (remain > 0) {
    ssize_t w = ::write(ufd.get(), p, remain);
    if (w < 0) { msg = std::string("write layout failed: ") + tmp.string(); return false; }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write layout failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write layout failed: ") + tmp.string(); return false; }
#endif
  if (!ufd.close_checked()) { msg = std::string("write layout failed: ") + tmp.string(); return false; }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write layout failed: ") + path.string(); return false; }
  LOG_DEBUG("layout saved to {}", path.string());
  msg = std::string("saved layout: ") + path.string();
  return true;
}

bool load_layout(const std::filesystem::path& path, SplitView& view, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmapReadLines(path, lines, msg)) return false;
  std::string text;
  for (const auto& l : lines) { text += l; text += '\n'; }
  SavedLayout saved;
  std::string err;
  if (!parse_layout(text, view.options(), saved, err)) {
    LOG_WARN("rejected layout {}: {}", path.string(), err);
    msg = path.string() + ": " + err;
    return false;
  }
  view.restore(saved.panels, saved.orientation, saved.sync);
  LOG_INFO("layout loaded from {} ({} panels)", path.string(), saved.panels.size());
  msg = std::string("loaded layout: ") + path.string();
  return true;
}

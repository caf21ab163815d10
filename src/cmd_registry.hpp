#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch ex commands (":add", ":set minsize" ...).
 * Design: map name -> handler (args vector); Workbench parses and routes.
 */
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

// Whole-number command argument within [lo, hi]; signs, fractions and
// out-of-range digit strings are rejected before any conversion.
inline bool parse_int_arg(const std::string& s, int lo, int hi, int& out) {
  if (s.empty() || s.size() > 9) return false;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  long v = std::stol(s);
  if (v < lo || v > hi) return false;
  out = static_cast<int>(v);
  return true;
}

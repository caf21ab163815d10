#include "workbench.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <filesystem>
#include "layout_store.hpp"
#include "logger.hpp"

static std::string join_args(const std::vector<std::string>& args, size_t from) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) {
    if (!out.empty()) out += ' ';
    out += args[i];
  }
  return out;
}

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

static bool parse_number(const std::string& s, double& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0 || c == '.'; });
  if (!ok) return false;
  try { out = std::stod(s); } catch (const std::exception&) { return false; }
  return true;
}

void Workbench::register_commands() {
  registry.register_command("add", [this](const std::vector<std::string>& args){
    if (args.empty()) add_split(std::nullopt);
    else add_split(std::filesystem::path(join_args(args, 0)));
  });
  registry.register_command("close", [this](const std::vector<std::string>& args){
    if (args.empty()) { close_split(active); return; }
    auto id = panel_by_number(args[0]);
    if (!id) { message = "close: no panel " + args[0]; return; }
    close_split(*id);
  });
  registry.register_command("only", [this](const std::vector<std::string>&){ close_all_splits(); });
  registry.register_command("open", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "open: use :open <path>"; return; }
    ContentHandle h = open_document(join_args(args, 0));
    if (h == kNoContent) return;
    view.set_panel_content(active, h);
    viewports[active] = Viewport{};
  });
  registry.register_command("rename", [this](const std::vector<std::string>& args){
    if (args.size() < 2) { message = "rename: use :rename <n> <title>"; return; }
    auto id = panel_by_number(args[0]);
    if (!id) { message = "rename: no panel " + args[0]; return; }
    view.rename_panel(*id, join_args(args, 1));
  });
  registry.register_command("title", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "title: use :title <title>"; return; }
    view.rename_panel(active, join_args(args, 0));
  });
  registry.register_command("orient", [this](const std::vector<std::string>& args){
    finish_drag();
    if (args.empty()) { view.toggle_orientation(); return; }
    const std::string& v = args[0];
    if (v == "h" || v == "horizontal") view.set_orientation(Orientation::Horizontal);
    else if (v == "v" || v == "vertical") view.set_orientation(Orientation::Vertical);
    else message = "orient: use :orient h|v";
  });
  registry.register_command("sync", [this](const std::vector<std::string>& args){
    bool on = false;
    if (!parse_on_off(args, view.sync_scrolling(), on)) { message = "sync: use :sync on|off"; return; }
    view.set_sync(on);
    message = on ? "sync scrolling on" : "sync scrolling off";
  });
  registry.register_command("reset", [this](const std::vector<std::string>&){ view.reset_sizes(); });
  registry.register_command("save", [this](const std::vector<std::string>& args){
    std::filesystem::path p = !args.empty() ? std::filesystem::path(join_args(args, 0))
                            : (layout_path ? *layout_path : default_layout_path());
    std::string m;
    save_layout(p, view, m);
    message = m;
    if (!args.empty()) layout_path = p;
  });
  registry.register_command("load", [this](const std::vector<std::string>& args){
    std::filesystem::path p = !args.empty() ? std::filesystem::path(join_args(args, 0))
                            : (layout_path ? *layout_path : default_layout_path());
    std::string m;
    if (load_layout(p, view, m)) active = view.registry().at(0).id;
    message = m;
  });
  registry.register_command("set minsize", [this](const std::vector<std::string>& args){
    double v = 0;
    if (args.empty() || !parse_number(args[0], v)) { message = "set minsize: use :set minsize <percent>"; return; }
    LayoutOptions opts = view.options();
    opts.min_size = v;
    std::string m;
    if (!view.set_options(opts, m)) { message = "set minsize: " + m; return; }
    message = "minsize " + args[0];
  });
  registry.register_command("set maxpanels", [this](const std::vector<std::string>& args){
    int v = 0;
    if (args.empty() || !parse_int_arg(args[0], 1, 100, v)) { message = "set maxpanels: use :set maxpanels <1-100>"; return; }
    LayoutOptions opts = view.options();
    opts.max_panels = v;
    std::string m;
    if (!view.set_options(opts, m)) { message = "set maxpanels: " + m; return; }
    message = "maxpanels " + args[0];
  });
  registry.register_command("set clamp", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "set clamp: use :set clamp strict|legacy"; return; }
    LayoutOptions opts = view.options();
    if (args[0] == "strict") opts.clamp = ClampPolicy::Strict;
    else if (args[0] == "legacy") opts.clamp = ClampPolicy::Legacy;
    else { message = "set clamp: use :set clamp strict|legacy"; return; }
    std::string m;
    if (!view.set_options(opts, m)) { message = "set clamp: " + m; return; }
    message = "clamp " + args[0];
  });
  registry.register_command("set mouse", [this](const std::vector<std::string>& args){
    bool on = false;
    if (!parse_on_off(args, enable_mouse, on)) { message = "set mouse: use :set mouse on|off"; return; }
    set_mouse(on);
    message = on ? "mouse on" : "mouse off";
  });
  registry.register_command("set autosave", [this](const std::vector<std::string>& args){
    bool on = false;
    if (!parse_on_off(args, autosave, on)) { message = "set autosave: use :set autosave on|off"; return; }
    autosave = on;
    message = on ? "autosave on" : "autosave off";
  });
  registry.register_command("help", [this](const std::vector<std::string>&){
    std::string s;
    for (const auto& n : registry.names()) { if (!s.empty()) s += ", "; s += n; }
    message = s;
  });
  registry.register_command("q", [this](const std::vector<std::string>&){ should_quit = true; });
  registry.register_command("quit", [this](const std::vector<std::string>&){ should_quit = true; });
}

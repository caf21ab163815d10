#include <ncurses.h>
#include "workbench.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"
#include "layout_store.hpp"
#include "logger.hpp"
#include "pane_layout.hpp"
#include "terminal.hpp"

static constexpr int CTRL_u = 'U'-64;
static constexpr int CTRL_d = 'D'-64;
static constexpr int ESC = 27;
static constexpr int TAB = '\t';
static constexpr int kWheelStep = 3;

static std::string normalize_key(const std::filesystem::path& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) return p.lexically_normal().string();
  return abs.lexically_normal().string();
}

Workbench::Workbench(const std::vector<std::filesystem::path>& files,
                     const std::optional<std::filesystem::path>& layout_file)
    : view(files.empty() ? kNoContent : open_document(files.front())), layout_path(layout_file) {
  view.set_change_listener([this](const std::vector<PanelSnapshot>& panels){ on_layout_changed(panels); });
  register_commands();
  load_rc();
  if (layout_path) {
    std::error_code ec;
    if (std::filesystem::exists(*layout_path, ec)) {
      std::string m;
      load_layout(*layout_path, view, m);
      message = m;
    }
  }
  for (size_t i = 1; i < files.size(); ++i) add_split(files[i]);
  active = view.registry().at(0).id;
  if (enable_mouse) Terminal::set_mouse(true);
  LOG_INFO("workbench started with {} panel(s)", view.registry().size());
}

ContentHandle Workbench::open_document(const std::filesystem::path& path) {
  std::string key = normalize_key(path);
  if (auto it = doc_table.find(key); it != doc_table.end()) return it->second;
  std::string m;
  auto d = Document::from_file(path, m);
  message = m;
  if (!d) {
    LOG_WARN("{}", m);
    return kNoContent;
  }
  documents.push_back(std::make_shared<Document>(std::move(*d)));
  ContentHandle h = static_cast<ContentHandle>(documents.size() - 1);
  doc_table[key] = h;
  LOG_DEBUG("opened {} as content {}", key, h);
  return h;
}

const Document* Workbench::document(ContentHandle h) const {
  if (h < 0 || h >= static_cast<ContentHandle>(documents.size())) return nullptr;
  return documents[h].get();
}

int Workbench::active_index() const {
  int idx = view.registry().index_of(active);
  return idx < 0 ? 0 : idx;
}

void Workbench::set_active(PanelId id) {
  if (view.registry().find(id)) active = id;
}

Viewport& Workbench::viewport(PanelId id) { return viewports[id]; }

void Workbench::scroll_panel(PanelId id, int drow, int dcol) {
  const Panel* p = view.registry().find(id);
  if (!p) return;
  Viewport& vp = viewport(id);
  const Document* d = document(p->content);
  int max_top = d ? std::max(0, d->line_count() - 1) : 0;
  int max_left = d ? std::max(0, d->max_width() - 1) : 0;
  vp.top_line = std::clamp(vp.top_line + drow, 0, max_top);
  vp.left_col = std::clamp(vp.left_col + dcol, 0, max_left);
  view.notify_scroll(id, vp, [this](PanelId target, const Viewport& off){ viewports[target] = off; });
}

void Workbench::on_layout_changed(const std::vector<PanelSnapshot>& panels) {
  // forget view state of panels that no longer exist
  for (auto it = viewports.begin(); it != viewports.end();) {
    bool alive = std::any_of(panels.begin(), panels.end(), [&](const PanelSnapshot& s){ return s.id == it->first; });
    if (alive) ++it; else it = viewports.erase(it);
  }
  if (!view.registry().find(active)) {
    int idx = std::min(active_index(), view.registry().size() - 1);
    active = view.registry().at(std::max(0, idx)).id;
  }
  if (autosave) {
    std::string m;
    if (!save_layout(layout_path ? *layout_path : default_layout_path(), view, m)) {
      message = m;
      LOG_ERROR("{}", m);
    }
  }
}

std::optional<PanelId> Workbench::panel_by_number(const std::string& s) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return std::nullopt;
  int n = 0;
  try { n = std::stoi(s); } catch (const std::exception&) { return std::nullopt; }
  if (n < 1 || n > view.registry().size()) return std::nullopt;
  return view.registry().at(n - 1).id;
}

void Workbench::add_split(const std::optional<std::filesystem::path>& file) {
  ContentHandle h = file ? open_document(*file) : kNoContent;
  std::string m;
  if (auto id = view.add_split(h, m)) {
    set_active(*id);
    if (!file) message.clear();
  } else {
    message = m;
  }
}

void Workbench::close_split(PanelId id) {
  int idx = view.registry().index_of(id);
  std::string m;
  if (!view.close_split(id, m)) { message = m; return; }
  if (id == active) {
    idx = std::clamp(idx, 0, view.registry().size() - 1);
    active = view.registry().at(idx).id;
  }
}

void Workbench::close_all_splits() {
  active = view.close_all_splits();
}

void Workbench::nudge_active(int cells) {
  int n = view.registry().size();
  if (n < 2) { message = "nothing to resize"; return; }
  int k = active_index();
  // the last panel grows by moving the boundary before it the other way
  if (k == n - 1) { k = n - 2; cells = -cells; }
  Rect area = panel_area(term.getSize());
  int extent = axis_extent(area, view.orientation());
  if (view.resizing()) finish_drag();
  if (!view.begin_resize(k, 0)) return;
  view.update_resize(cells, extent);
  view.end_resize();
}

void Workbench::focus_step(int step) {
  int n = view.registry().size();
  if (n <= 1) return;
  int idx = ((active_index() + step) % n + n) % n;
  active = view.registry().at(idx).id;
}

void Workbench::run_toolbar(ToolbarAction a) {
  switch (a) {
    case ToolbarAction::Orientation: finish_drag(); view.toggle_orientation(); break;
    case ToolbarAction::Add: add_split(std::nullopt); break;
    case ToolbarAction::Sync: message = view.toggle_sync() ? "sync scrolling on" : "sync scrolling off"; break;
    case ToolbarAction::Reset: view.reset_sizes(); break;
    case ToolbarAction::CloseAll: close_all_splits(); break;
  }
}

void Workbench::finish_drag() {
  if (view.resizing()) view.end_resize();
}

void Workbench::set_mouse(bool on) {
  if (!on) finish_drag();
  enable_mouse = on;
  Terminal::set_mouse(on);
}

void Workbench::run() {
  while (!should_quit) {
    render();
    int ch = term.read_key();
    handle_input(ch);
  }
  finish_drag();
  LOG_INFO("workbench exiting");
}

void Workbench::render() {
  RenderState st;
  st.view = &view;
  for (const auto& p : view.registry().panels()) {
    PanelRenderInfo info;
    info.doc = document(p.content);
    info.vp = viewport(p.id);
    info.is_active = p.id == active;
    st.panels.push_back(info);
  }
  st.message = message;
  st.cmdline = cmdline;
  st.command_mode = mode == Mode::Command;
  term.show_cursor(st.command_mode);
  renderer.render(term, st);
}

void Workbench::handle_input(int ch) {
  if (ch == ERR) return;
  if (ch == KEY_RESIZE) { finish_drag(); return; }
  if (enable_mouse && ch == KEY_MOUSE) { handle_mouse(); return; }
  // any key ends a drag whose release we never saw
  finish_drag();
  if (mode == Mode::Command) { handle_command_input(ch); return; }
  handle_normal_input(ch);
}

void Workbench::handle_normal_input(int ch) {
  if (input.take_window_prefix()) {
    switch (ch) {
      case 'w': case 'l': case 'j': focus_step(1); return;
      case 'W': case 'h': case 'k': focus_step(-1); return;
      case 'c': close_split(active); return;
      case 'o': close_all_splits(); return;
      case '=': view.reset_sizes(); return;
      default: break;
    }
  }
  if (input.consume_ctrl_w(ch)) return;
  if (input.consume_digit(ch)) return;
  int rows = std::max(1, panel_area(term.getSize()).height / 2);
  switch (ch) {
    case 'j': case KEY_DOWN: scroll_panel(active, static_cast<int>(input.take_count()), 0); break;
    case 'k': case KEY_UP: scroll_panel(active, -static_cast<int>(input.take_count()), 0); break;
    case 'l': case KEY_RIGHT: scroll_panel(active, 0, static_cast<int>(input.take_count())); break;
    case 'h': case KEY_LEFT: scroll_panel(active, 0, -static_cast<int>(input.take_count())); break;
    case CTRL_d: case KEY_NPAGE: scroll_panel(active, rows, 0); break;
    case CTRL_u: case KEY_PPAGE: scroll_panel(active, -rows, 0); break;
    case 'g': scroll_panel(active, -viewport(active).top_line, 0); break;
    case '>': nudge_active(static_cast<int>(input.take_count(2))); break;
    case '<': nudge_active(-static_cast<int>(input.take_count(2))); break;
    case TAB: focus_step(1); break;
    case KEY_BTAB: focus_step(-1); break;
    case 'a': run_toolbar(ToolbarAction::Add); break;
    case 'x': close_split(active); break;
    case 'o': run_toolbar(ToolbarAction::Orientation); break;
    case 's': run_toolbar(ToolbarAction::Sync); break;
    case '=': run_toolbar(ToolbarAction::Reset); break;
    case 'O': run_toolbar(ToolbarAction::CloseAll); break;
    case ':': mode = Mode::Command; cmdline.clear(); break;
    case ESC: message.clear(); break;
    default: break;
  }
  input.reset();
}

void Workbench::handle_command_input(int ch) {
  if (ch == ESC) { mode = Mode::Normal; cmdline.clear(); return; }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') {
    mode = Mode::Normal;
    execute_command();
    cmdline.clear();
    return;
  }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline.empty()) { mode = Mode::Normal; return; }
    cmdline.pop_back();
    return;
  }
  if (ch >= 32 && ch < 127) cmdline.push_back(static_cast<char>(ch));
}

void Workbench::handle_mouse() {
  MEVENT me;
  if (!term.read_mouse(me)) return;
  Rect area = panel_area(term.getSize());
  Orientation o = view.orientation();
  int pos = axis_coord(me.y, me.x, o);
  int extent = axis_extent(area, o);
  if (view.resizing()) {
    if (me.bstate & REPORT_MOUSE_POSITION) { view.update_resize(pos, extent); return; }
    // release anywhere, or any other button event, ends the session
    view.update_resize(pos, extent);
    view.end_resize();
    if (me.bstate & BUTTON1_RELEASED) return;
  }
  std::vector<PaneRect> rects;
  const PanelRegistry& reg = view.registry();
  collect_layout(reg.sizes(), o, area, rects);
  if (me.bstate & BUTTON1_PRESSED) {
    if (me.y == 0) {
      for (const auto& it : toolbar_items(view)) {
        if (me.x >= it.col && me.x < it.col + static_cast<int>(it.label.size())) { run_toolbar(it.action); return; }
      }
      return;
    }
    int k = hit_divider(rects, o, me.y, me.x);
    if (k >= 0) { view.begin_resize(k, pos); return; }
    for (const auto& pr : rects) {
      if (!contains(pr.rect, me.y, me.x)) continue;
      PanelId id = reg.at(pr.pane).id;
      if (hit_close_button(content_rect(pr, reg.size(), o), reg.size(), me.y, me.x)) { close_split(id); return; }
      set_active(id);
      return;
    }
    return;
  }
  int wheel = 0;
  #ifdef BUTTON4_PRESSED
  if (me.bstate & BUTTON4_PRESSED) wheel = -kWheelStep;
  #endif
  #ifdef BUTTON5_PRESSED
  if (me.bstate & BUTTON5_PRESSED) wheel = kWheelStep;
  #endif
  if (wheel == 0) return;
  for (const auto& pr : rects) {
    if (contains(pr.rect, me.y, me.x)) { scroll_panel(reg.at(pr.pane).id, wheel, 0); return; }
  }
}

void Workbench::execute_command() {
  std::istringstream iss(cmdline);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  LOG_DEBUG("command :{}", cmdline);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry.execute(composite, subargs)) { message = "unknown command: " + composite; }
    return;
  }
  if (!registry.execute(cmd, args)) { message = "unknown command: " + cmd; }
}

std::filesystem::path Workbench::default_layout_path() const {
  const char* home = std::getenv("HOME");
  if (!home) return std::filesystem::path(".splitview_layout");
  return std::filesystem::path(home) / ".splitview_layout";
}

void Workbench::load_rc() {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / ".splitviewrc";
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmapReadLines(p, lines, msg)) { message = msg; LOG_WARN("{}", msg); return; }
  for (std::string s : lines) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (!s.empty() && s[0] == ':') s.erase(s.begin());
    std::string old = cmdline;
    cmdline = s;
    execute_command();
    cmdline = old;
  }
  LOG_INFO("loaded {}", p.string());
}

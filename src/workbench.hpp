#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"
#include "document.hpp"
#include "split_view.hpp"
#include "input.hpp"
#include "renderer.hpp"
#include "ncurses_terminal.hpp"
#include "cmd_registry.hpp"

class Workbench {
public:
  Workbench(const std::vector<std::filesystem::path>& files,
            const std::optional<std::filesystem::path>& layout_file);
  void run();

private:
  ContentHandle open_document(const std::filesystem::path& path);
  const Document* document(ContentHandle h) const;
  int active_index() const;
  void set_active(PanelId id);
  Viewport& viewport(PanelId id);
  void scroll_panel(PanelId id, int drow, int dcol);
  void on_layout_changed(const std::vector<PanelSnapshot>& panels);
  std::optional<PanelId> panel_by_number(const std::string& s);

  void add_split(const std::optional<std::filesystem::path>& file);
  void close_split(PanelId id);
  void close_all_splits();
  void nudge_active(int cells);
  void focus_step(int step);
  void run_toolbar(ToolbarAction a);
  void finish_drag();
  void set_mouse(bool on);

  void render();
  void handle_input(int ch);
  void handle_normal_input(int ch);
  void handle_command_input(int ch);
  void handle_mouse();
  void execute_command();
  void register_commands();
  void load_rc();
  std::filesystem::path default_layout_path() const;

  // documents and message are initialized before view, which opens the first file
  std::vector<std::shared_ptr<Document>> documents; // indexed by ContentHandle
  std::unordered_map<std::string, ContentHandle> doc_table;
  std::string message;
  SplitView view;
  std::unordered_map<PanelId, Viewport> viewports;
  PanelId active = 0;
  Mode mode = Mode::Normal;
  std::string cmdline;
  bool should_quit = false;
  bool enable_mouse = true;
  bool autosave = false;
  std::optional<std::filesystem::path> layout_path;
  Input input;
  Renderer renderer;
  NcursesTerminal term;
  CommandRegistry registry;
};

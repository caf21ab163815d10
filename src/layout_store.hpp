#pragma once
/*
 * LayoutStore
 *
 * Purpose: save/restore a split layout (orientation, sync, panel sizes and titles).
 * Format: one directive per line, '#' comments:
 *           orientation horizontal|vertical
 *           sync on|off
 *           panel <size> [title...]
 * Feature: safe writes (write .tmp -> fdatasync -> atomic rename); loads are
 *          validated in full and applied all-or-nothing.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "split_view.hpp"

struct SavedLayout {
  Orientation orientation = Orientation::Horizontal;
  bool sync = false;
  std::vector<PanelSnapshot> panels;
};

std::string format_layout(const SplitView& view);
bool parse_layout(const std::string& text, const LayoutOptions& opts, SavedLayout& out, std::string& msg);

bool save_layout(const std::filesystem::path& path, const SplitView& view, std::string& msg);
bool load_layout(const std::filesystem::path& path, SplitView& view, std::string& msg);

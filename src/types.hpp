#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/PanelId/Orientation/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>
#include <optional>
#include <string>

using PanelId = std::uint64_t;

// Handle into content owned by the caller; the layout never looks inside.
using ContentHandle = int;
inline constexpr ContentHandle kNoContent = -1;

enum class Mode { Normal, Command };

enum class Orientation { Horizontal, Vertical };

enum class ClampPolicy { Strict, Legacy };

// Scroll offsets of a mounted panel (rows/columns of content).
struct Viewport { int top_line = 0; int left_col = 0; };

inline bool operator==(const Viewport& a, const Viewport& b) {
  return a.top_line == b.top_line && a.left_col == b.left_col;
}

struct PanelSnapshot {
  PanelId id = 0;
  std::optional<std::string> title;
  double size = 0.0;
};

inline const char* orientation_name(Orientation o) {
  return o == Orientation::Horizontal ? "horizontal" : "vertical";
}

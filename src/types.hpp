#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Position/Range/EditError).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <compare>
#include <string_view>

enum class Mode { Normal, Insert, Visual, Command };

struct Position {
  int row = 0;
  int col = 0;
  auto operator<=>(const Position&) const = default;
};

/* half-open [start, end) */
struct Range {
  Position start;
  Position end;
  bool empty() const { return start == end; }
};

struct Viewport { int top_line = 0; int left_col = 0; };

enum class EditError { None, OutOfBounds, EmptyHistory, ParseFailure };

inline std::string_view describe(EditError e) {
  switch (e) {
    case EditError::None: return "ok";
    case EditError::OutOfBounds: return "position out of bounds";
    case EditError::EmptyHistory: return "nothing to undo/redo";
    case EditError::ParseFailure: return "parse failure";
  }
  return "unknown";
}

inline std::string_view mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Visual: return "VISUAL";
    case Mode::Command: return "COMMAND";
  }
  return "";
}

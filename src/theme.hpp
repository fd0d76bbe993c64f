#pragma once
/*
 * Theme
 *
 * Purpose: terminal colour for each highlight category.
 * Note: the one process-wide table; keyword cyan as in TokyoNight Storm.
 */
#include <array>
#include <ncurses.h>
#include "syntax.hpp"

struct ThemeEntry {
  short fg;
  bool bold;
};

struct Theme {
  const char* name;
  std::array<ThemeEntry, kHighlightCategoryCount> entries;
  const ThemeEntry& operator[](HighlightCategory c) const { return entries[static_cast<size_t>(c)]; }
};

inline const Theme& active_theme() {
  static const Theme theme{"tokyonight-storm", {{
      {-1, false},           // text
      {COLOR_BLUE, false},   // comment
      {COLOR_CYAN, true},    // keyword
      {COLOR_GREEN, false},  // string
      {COLOR_YELLOW, false}, // number
      {COLOR_YELLOW, true},  // constant
      {COLOR_MAGENTA, false},// type
      {COLOR_BLUE, true},    // function
      {COLOR_CYAN, false},   // operator
      {-1, false},           // punctuation
      {COLOR_RED, false},    // preprocessor
  }}};
  return theme;
}

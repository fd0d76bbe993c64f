#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible lines, gutter, status/command line and manage
 * viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; pulls LineViews from Editor::visible_lines().
 */
#include "types.hpp"
#include "iterminal.hpp"

class Editor;

class Renderer {
public:
  void render(ITerminal& term, const Editor& ed, Viewport& vp);
  /* keeps the active cursor inside a text area of the given size */
  static void scroll_to_cursor(Viewport& vp, const Position& cur, int text_rows, int text_cols);
};

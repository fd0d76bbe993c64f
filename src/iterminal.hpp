#pragma once
/*
 * ITerminal
 *
 * Purpose: drawing surface and key source for the Renderer and main loop.
 * Implementations: NcursesTerminal (interactive), HeadlessTerminal (tests).
 * Note: rows/cols are screen cells; text is drawn byte for byte.
 */
#include <string>
#include "input.hpp"
#include "syntax.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_category(int row, int col, const std::string& text, HighlightCategory cat) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  /* blocks for the next key; Key::None on resize or timeout */
  virtual KeyEvent read_key() = 0;
};

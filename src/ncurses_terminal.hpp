#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Lifetime: owns the curses screen; the constructor enters raw/noecho/keypad
 * mode and the destructor restores the terminal.
 * Note: one colour pair per highlight category, taken from the active theme.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_category(int row, int col, const std::string& text, HighlightCategory cat) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  KeyEvent read_key() override;
private:
  void init_colors();
  bool colors_ = false;
};

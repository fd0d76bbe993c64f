#include "ncurses_terminal.hpp"
#include "theme.hpp"
#include <algorithm>
#include <clocale>
#include <ncurses.h>
#include <glog/logging.h>

static constexpr short kTextPair = 1;
static short pair_for(HighlightCategory c) { return static_cast<short>(kTextPair + 1 + static_cast<int>(c)); }

NcursesTerminal::NcursesTerminal() {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  timeout(100); // wake up to repaint finished highlight jobs
  init_colors();
  VLOG(1) << "curses screen " << LINES << "x" << COLS << (colors_ ? " colour" : " mono");
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

void NcursesTerminal::init_colors() {
  if (!has_colors()) return;
  start_color();
  bool default_bg = use_default_colors() == OK;
  short bg = default_bg ? -1 : COLOR_BLACK;
  init_pair(kTextPair, default_bg ? -1 : COLOR_WHITE, bg);
  const Theme& theme = active_theme();
  for (int i = 0; i < kHighlightCategoryCount; ++i) {
    auto cat = static_cast<HighlightCategory>(i);
    short fg = theme[cat].fg;
    if (fg < 0 && !default_bg) fg = COLOR_WHITE;
    init_pair(pair_for(cat), fg, bg);
  }
  colors_ = true;
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(kTextPair));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(kTextPair));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_end > hl_start) {
    std::string mid = text.substr(hl_start, hl_end - hl_start);
    attron(A_REVERSE);
    mvaddnstr(row, col + hl_start, mid.c_str(), (int)mid.size());
    attroff(A_REVERSE);
  } else if (len == 0 && hl_len > 0) {
    // selected empty line: one reversed cell
    attron(A_REVERSE);
    mvaddch(row, col, ' ');
    attroff(A_REVERSE);
  }
}

void NcursesTerminal::draw_category(int row, int col, const std::string& text, HighlightCategory cat) {
  if (!colors_) { mvaddnstr(row, col, text.c_str(), (int)text.size()); return; }
  attr_t attrs = COLOR_PAIR(pair_for(cat));
  if (active_theme()[cat].bold) attrs |= A_BOLD;
  attron(attrs);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(attrs);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

KeyEvent NcursesTerminal::read_key() {
  int ch = getch();
  switch (ch) {
    case ERR:
    case KEY_RESIZE: return KeyEvent::special(Key::None);
    case 27: return KeyEvent::special(Key::Escape);
    case KEY_BACKSPACE: case 127: case 8: return KeyEvent::special(Key::Backspace);
    case KEY_ENTER: case '\n': case '\r': return KeyEvent::special(Key::Enter);
    case '\t': return KeyEvent::special(Key::Tab);
    case KEY_DC: return KeyEvent::special(Key::Delete);
    case KEY_LEFT: return KeyEvent::special(Key::Left);
    case KEY_RIGHT: return KeyEvent::special(Key::Right);
    case KEY_UP: return KeyEvent::special(Key::Up);
    case KEY_DOWN: return KeyEvent::special(Key::Down);
    case KEY_HOME: return KeyEvent::special(Key::Home);
    case KEY_END: return KeyEvent::special(Key::End);
    default: break;
  }
  if (ch >= 1 && ch <= 26) return KeyEvent::control(static_cast<char>('a' + ch - 1));
  if (ch >= 0 && ch < 256) return KeyEvent::character(static_cast<char>(ch));
  return KeyEvent::special(Key::None);
}

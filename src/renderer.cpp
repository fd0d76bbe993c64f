#include "renderer.hpp"
#include "editor.hpp"
#include <algorithm>
#include <cstring>
#include <string>

static void render_welcome(ITerminal& term, int rows, int cols) {
  const char* art[] = {
    " GGG  L    Y   Y PPPP  H  H",
    "G     L     Y Y  P   P H  H",
    "G  GG L      Y   PPPP  HHHH",
    "G   G L      Y   P     H  H",
    " GGG  LLLL   Y   P     H  H",
  };
  int lines = 5;
  int max_text_rows = std::max(0, rows - 1);
  int start_row = std::max(0, (max_text_rows - lines) / 2);
  int max_len = 0;
  for (int i = 0; i < lines; i++) max_len = std::max(max_len, static_cast<int>(std::strlen(art[i])));
  int start_col = std::max(0, (cols - max_len) / 2);
  for (int i = 0; i < lines; i++) term.draw_text(start_row + i, start_col, std::string(art[i]));
}

void Renderer::scroll_to_cursor(Viewport& vp, const Position& cur, int text_rows, int text_cols) {
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (text_rows > 0 && cur.row >= vp.top_line + text_rows) vp.top_line = cur.row - text_rows + 1;
  if (text_cols <= 0) { vp.left_col = 0; return; }
  if (cur.col < vp.left_col) vp.left_col = cur.col;
  else if (cur.col >= vp.left_col + text_cols) vp.left_col = cur.col - text_cols + 1;
  vp.left_col = std::max(0, vp.left_col);
}

void Renderer::render(ITerminal& term, const Editor& ed, Viewport& vp) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(0, rows - 1);
  const TextBuffer& buf = ed.buffer();
  const Options& opts = ed.options();

  int indent = 0;
  int ln_width = 0;
  if (opts.show_line_numbers) {
    ln_width = static_cast<int>(std::to_string(std::max(1, buf.line_count())).size());
    indent = ln_width + 1;
  }
  int text_cols = std::max(0, cols - indent);
  Position cur = ed.cursors().active().pos;
  scroll_to_cursor(vp, cur, max_text_rows, text_cols);

  bool show_welcome = !ed.file_path() && buf.line_count() == 1 && buf.line_length(0) == 0 && !ed.modified();
  if (show_welcome) {
    render_welcome(term, rows, cols);
  } else {
    int screen = 0;
    for (const LineView& lv : ed.visible_lines(vp.top_line, max_text_rows)) {
      int i = screen++;
      int s_len = static_cast<int>(lv.text.size());
      int start_col = std::min(vp.left_col, s_len);
      int end_col = std::min(s_len, start_col + text_cols);
      std::string vis = lv.text.substr(start_col, end_col - start_col);
      if (opts.show_line_numbers) {
        std::string num = std::to_string(lv.row + 1);
        term.draw_text(i, 0, std::string(ln_width - num.size(), ' ') + num + " ");
      }
      term.draw_text(i, indent, vis);
      if (opts.enable_color) {
        for (const auto& sp : lv.spans) {
          if (sp.category == HighlightCategory::Text) continue;
          int a = std::max(static_cast<int>(sp.start), start_col);
          int b = std::min(static_cast<int>(sp.end), end_col);
          if (a >= b) continue;
          term.draw_category(i, indent + a - start_col, lv.text.substr(a, b - a), sp.category);
        }
      }
      for (const auto& [c0, c1] : lv.selections) {
        int a = std::max(c0, start_col) - start_col;
        int b = std::min(c1, std::max(end_col, start_col + 1)) - start_col;
        if (b > a) term.draw_highlighted(i, indent, vis, a, b - a);
      }
      term.clear_to_eol(i, indent + static_cast<int>(vis.size()));
    }
  }

  std::string status = ed.status_line();
  if (static_cast<int>(status.size()) > cols) status.resize(std::max(0, cols));
  term.draw_text(rows - 1, 0, status);

  if (ed.mode() == Mode::Command) {
    term.move_cursor(rows - 1, std::min(cols - 1, 1 + static_cast<int>(ed.cmdline().size())));
  } else {
    int screen_row = cur.row - vp.top_line;
    int screen_col = indent + std::max(0, cur.col - vp.left_col);
    if (screen_row >= 0 && screen_row < max_text_rows) term.move_cursor(screen_row, std::min(screen_col, cols - 1));
    else term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}

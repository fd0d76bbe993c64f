#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests. Keeps a character grid plus a
 * per-cell attribute grid and replays queued keys from read_key().
 * Note: attribute cells hold ' ' (plain), 'R' (reversed) or 'a' + category.
 */
#include <algorithm>
#include <deque>
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override {
    cells_.assign(rows_, std::string(cols_, ' '));
    attrs_.assign(rows_, std::string(cols_, ' '));
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, ' '); }
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override {
    put(row, col, text, ' ');
    std::string seg = text.substr(std::min<size_t>(text.size(), hl_start));
    seg.resize(hl_len, ' ');
    put(row, col + hl_start, seg, 'R');
  }
  void draw_category(int row, int col, const std::string& text, HighlightCategory cat) override {
    put(row, col, text, static_cast<char>('a' + static_cast<int>(cat)));
  }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refreshes_; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = std::max(0, col); c < cols_; ++c) { cells_[row][c] = ' '; attrs_[row][c] = ' '; }
  }
  KeyEvent read_key() override {
    if (keys_.empty()) return {};
    KeyEvent ev = keys_.front();
    keys_.pop_front();
    return ev;
  }

  void push_keys(std::string_view keys) {
    for (const auto& ev : parse_keys(keys)) keys_.push_back(ev);
  }
  /* row text with trailing blanks removed */
  std::string row_text(int row) const {
    std::string s = cells_.at(row);
    s.erase(s.find_last_not_of(' ') + 1);
    return s;
  }
  char attr_at(int row, int col) const { return attrs_.at(row).at(col); }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, char attr) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c < 0) continue;
      if (c >= cols_) break;
      cells_[row][c] = text[i];
      attrs_[row][c] = attr;
    }
  }

  int rows_, cols_;
  std::vector<std::string> cells_, attrs_;
  std::deque<KeyEvent> keys_;
  int cursor_row_ = 0, cursor_col_ = 0;
  int refreshes_ = 0;
};

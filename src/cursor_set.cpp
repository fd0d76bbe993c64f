#include "cursor_set.hpp"
#include "text_buffer.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}
static inline bool is_word(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_' || c >= 0x80;
}
/* 0 blank, 1 word, 2 symbol */
static inline int char_class(unsigned char c) {
  if (is_space(c)) return 0;
  return is_word(c) ? 1 : 2;
}

int max_col(const TextBuffer& buf, int row, bool past_end) {
  int len = buf.line_length(row);
  if (past_end) return len;
  return len > 0 ? len - 1 : 0;
}

Range Cursor::selection() const {
  if (!anchor) return {pos, pos};
  return {std::min(pos, *anchor), std::max(pos, *anchor)};
}

Position shift_position(const Position& p, const EditOp& op) {
  if (p < op.at) return p;
  if (op.kind == EditOp::Insert) {
    if (p.row == op.at.row) return {op.end.row, op.end.col + (p.col - op.at.col)};
    return {p.row + (op.end.row - op.at.row), p.col};
  }
  if (p < op.end) return op.at;
  if (p.row == op.end.row) return {op.at.row, op.at.col + (p.col - op.end.col)};
  return {p.row - (op.end.row - op.at.row), p.col};
}

static Position next_word_start(const TextBuffer& buf, Position p, bool past_end) {
  int rows = buf.line_count();
  std::string s = buf.line(p.row);
  int len = static_cast<int>(s.size());
  if (p.col < len) {
    int cls = char_class(static_cast<unsigned char>(s[p.col]));
    if (cls != 0) {
      while (p.col < len && char_class(static_cast<unsigned char>(s[p.col])) == cls) p.col++;
    }
  }
  while (true) {
    while (p.col < len && is_space(static_cast<unsigned char>(s[p.col]))) p.col++;
    if (p.col < len) return p;
    if (p.row + 1 >= rows) { p.col = max_col(buf, p.row, past_end); return p; }
    p.row++;
    p.col = 0;
    s = buf.line(p.row);
    len = static_cast<int>(s.size());
    if (len == 0) return p; // empty line is a word stop
  }
}

static Position prev_word_start(const TextBuffer& buf, Position p) {
  std::string s = buf.line(p.row);
  auto step_back = [&]() {
    if (p.col > 0) { p.col--; return true; }
    if (p.row > 0) { p.row--; s = buf.line(p.row); p.col = static_cast<int>(s.size()); return true; }
    return false;
  };
  Position from = p;
  if (!step_back()) return from;
  while (true) {
    int len = static_cast<int>(s.size());
    if (len == 0) return {p.row, 0};
    if (p.col < len && !is_space(static_cast<unsigned char>(s[p.col]))) break;
    if (!step_back()) return {0, 0};
  }
  int cls = char_class(static_cast<unsigned char>(s[p.col]));
  while (p.col > 0 && char_class(static_cast<unsigned char>(s[p.col - 1])) == cls) p.col--;
  return p;
}

static Position next_word_end(const TextBuffer& buf, Position p, bool past_end) {
  int rows = buf.line_count();
  std::string s = buf.line(p.row);
  int len = static_cast<int>(s.size());
  auto step_fwd = [&]() {
    if (p.col + 1 < len) { p.col++; return true; }
    if (p.row + 1 < rows) { p.row++; s = buf.line(p.row); len = static_cast<int>(s.size()); p.col = 0; return true; }
    return false;
  };
  Position from = p;
  if (!step_fwd()) return from;
  while (len == 0 || is_space(static_cast<unsigned char>(s[p.col]))) {
    if (!step_fwd()) return {p.row, max_col(buf, p.row, past_end)};
  }
  int cls = char_class(static_cast<unsigned char>(s[p.col]));
  while (p.col + 1 < len && char_class(static_cast<unsigned char>(s[p.col + 1])) == cls) p.col++;
  return p;
}

static Position paragraph_target(const TextBuffer& buf, Position p, Direction dir, bool past_end) {
  int rows = buf.line_count();
  int step = (dir == Direction::Forward) ? 1 : -1;
  int r = p.row + step;
  while (r >= 0 && r < rows && buf.line_length(r) == 0) r += step;
  while (r >= 0 && r < rows && buf.line_length(r) != 0) r += step;
  if (r < 0) return {0, 0};
  if (r >= rows) return {rows - 1, max_col(buf, rows - 1, past_end)};
  return {r, 0};
}

Position CursorSet::motion_target(const TextBuffer& buf, const Position& from, Direction dir, Unit unit,
                                  bool past_end, int want_col) {
  bool fwd = (dir == Direction::Forward);
  Position p = from;
  switch (unit) {
    case Unit::Character:
      if (fwd) p.col = std::min(max_col(buf, p.row, past_end), p.col + 1);
      else if (p.col > 0) p.col--;
      break;
    case Unit::Line: {
      int target = fwd ? p.row + 1 : p.row - 1;
      if (target < 0 || target >= buf.line_count()) break;
      p.row = target;
      p.col = std::min(want_col, max_col(buf, target, past_end));
    } break;
    case Unit::LineBoundary:
      p.col = fwd ? max_col(buf, p.row, past_end) : 0;
      break;
    case Unit::FirstNonBlank: {
      std::string s = buf.line(p.row);
      int c = 0;
      while (c < static_cast<int>(s.size()) && is_space(static_cast<unsigned char>(s[c]))) c++;
      p.col = std::min(c, max_col(buf, p.row, past_end));
    } break;
    case Unit::Word:
      p = fwd ? next_word_start(buf, p, past_end) : prev_word_start(buf, p);
      break;
    case Unit::WordEnd:
      p = fwd ? next_word_end(buf, p, past_end) : prev_word_start(buf, p);
      break;
    case Unit::Paragraph:
      p = paragraph_target(buf, p, dir, past_end);
      break;
    case Unit::Document:
      p = fwd ? Position{buf.line_count() - 1, 0} : Position{0, 0};
      break;
  }
  return p;
}

CursorSet::CursorSet() : cursors_(1) {}

size_t CursorSet::add(const Position& p) {
  Cursor c;
  c.pos = p;
  c.want_col = p.col;
  cursors_.push_back(c);
  return cursors_.size() - 1;
}

void CursorSet::remove_secondary() {
  Cursor keep = active();
  cursors_.assign(1, keep);
  active_ = 0;
}

void CursorSet::set_active(size_t idx) {
  if (idx < cursors_.size()) active_ = idx;
}

void CursorSet::set_position(const Position& p) {
  active().pos = p;
  active().want_col = p.col;
}

void CursorSet::move(const TextBuffer& buf, Direction dir, Unit unit, bool past_end) {
  Cursor& c = active();
  c.pos = motion_target(buf, c.pos, dir, unit, past_end, c.want_col);
  if (unit == Unit::Line) return;
  if (unit == Unit::LineBoundary && dir == Direction::Forward) c.want_col = std::numeric_limits<int>::max();
  else c.want_col = c.pos.col;
}

bool CursorSet::find_in_line(const TextBuffer& buf, char ch, Direction dir) {
  Cursor& c = active();
  std::string s = buf.line(c.pos.row);
  int len = static_cast<int>(s.size());
  if (dir == Direction::Forward) {
    for (int i = c.pos.col + 1; i < len; ++i) {
      if (s[i] == ch) { c.pos.col = i; c.want_col = i; return true; }
    }
  } else {
    for (int i = std::min(c.pos.col, len) - 1; i >= 0; --i) {
      if (s[i] == ch) { c.pos.col = i; c.want_col = i; return true; }
    }
  }
  return false;
}

void CursorSet::on_buffer_mutated(const EditOp& op) {
  for (auto& c : cursors_) {
    Position moved = shift_position(c.pos, op);
    if (moved != c.pos) { c.pos = moved; c.want_col = moved.col; }
    if (c.anchor) c.anchor = shift_position(*c.anchor, op);
  }
}

void CursorSet::start_selection() { active().anchor = active().pos; }

void CursorSet::clear_selection() {
  for (auto& c : cursors_) c.anchor.reset();
}

void CursorSet::clamp(const TextBuffer& buf, bool past_end) {
  auto fix = [&](Position& p, bool allow_end) {
    p.row = std::clamp(p.row, 0, buf.line_count() - 1);
    p.col = std::clamp(p.col, 0, max_col(buf, p.row, allow_end));
  };
  for (auto& c : cursors_) {
    fix(c.pos, past_end);
    if (c.anchor) fix(*c.anchor, true);
  }
}

CursorSnapshot CursorSet::snapshot() const { return {cursors_, active_}; }

void CursorSet::restore(const CursorSnapshot& snap) {
  if (snap.cursors.empty()) { cursors_.assign(1, Cursor{}); active_ = 0; return; }
  cursors_ = snap.cursors;
  active_ = std::min(snap.active, cursors_.size() - 1);
}

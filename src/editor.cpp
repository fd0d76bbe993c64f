#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <glog/logging.h>

std::string Register::joined() const {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

Editor::Editor() {
  doc_.buf.add_observer([this](const EditOp& op) {
    cursors_.on_buffer_mutated(op);
    doc_.modified = true;
  });
  register_commands();
}

Editor::Editor(const std::optional<std::filesystem::path>& file) : Editor() {
  if (file) open(*file);
}

const Editor::Table& Editor::table() {
  static const Table t = [] {
    Table tb;
    for (auto& row : tb) row.fill(&Editor::ignore);
    auto set = [&](Mode m, KeyCategory c, Handler h) {
      tb[static_cast<size_t>(m)][static_cast<size_t>(c)] = h;
    };
    set(Mode::Normal, KeyCategory::Escape, &Editor::normal_escape);
    set(Mode::Normal, KeyCategory::Digit, &Editor::count_digit);
    set(Mode::Normal, KeyCategory::Motion, &Editor::motion_key);
    set(Mode::Normal, KeyCategory::PrefixArg, &Editor::prefix_arg);
    set(Mode::Normal, KeyCategory::Operator, &Editor::operator_key_pressed);
    set(Mode::Normal, KeyCategory::Edit, &Editor::normal_edit);
    set(Mode::Normal, KeyCategory::ModeSwitch, &Editor::normal_mode_switch);
    set(Mode::Normal, KeyCategory::History, &Editor::history_key);

    set(Mode::Insert, KeyCategory::Escape, &Editor::insert_escape);
    set(Mode::Insert, KeyCategory::Text, &Editor::insert_text);
    set(Mode::Insert, KeyCategory::Enter, &Editor::insert_enter);
    set(Mode::Insert, KeyCategory::Tab, &Editor::insert_tab);
    set(Mode::Insert, KeyCategory::Backspace, &Editor::insert_backspace);
    set(Mode::Insert, KeyCategory::Delete, &Editor::insert_delete);
    set(Mode::Insert, KeyCategory::Motion, &Editor::insert_motion);

    set(Mode::Visual, KeyCategory::Escape, &Editor::visual_escape);
    set(Mode::Visual, KeyCategory::Digit, &Editor::count_digit);
    set(Mode::Visual, KeyCategory::Motion, &Editor::motion_key);
    set(Mode::Visual, KeyCategory::PrefixArg, &Editor::prefix_arg);
    set(Mode::Visual, KeyCategory::Operator, &Editor::visual_operator);
    set(Mode::Visual, KeyCategory::ModeSwitch, &Editor::visual_escape);

    set(Mode::Command, KeyCategory::Escape, &Editor::command_escape);
    set(Mode::Command, KeyCategory::Text, &Editor::command_text);
    set(Mode::Command, KeyCategory::Backspace, &Editor::command_backspace);
    set(Mode::Command, KeyCategory::Enter, &Editor::command_enter);
    return tb;
  }();
  return t;
}

static bool in_set(const char* set, char c) {
  return c != 0 && std::strchr(set, c) != nullptr;
}

Editor::KeyCategory Editor::classify(const KeyEvent& ev) const {
  if (ev.key == Key::Escape) return KeyCategory::Escape;
  switch (mode_) {
    case Mode::Insert:
      switch (ev.key) {
        case Key::Char: return ev.ctrl ? KeyCategory::Other : KeyCategory::Text;
        case Key::Enter: return KeyCategory::Enter;
        case Key::Tab: return KeyCategory::Tab;
        case Key::Backspace: return KeyCategory::Backspace;
        case Key::Delete: return KeyCategory::Delete;
        case Key::Left: case Key::Right: case Key::Up: case Key::Down: case Key::Home: case Key::End:
          return KeyCategory::Motion;
        default: return KeyCategory::Other;
      }
    case Mode::Command:
      switch (ev.key) {
        case Key::Char: return ev.ctrl ? KeyCategory::Other : KeyCategory::Text;
        case Key::Enter: return KeyCategory::Enter;
        case Key::Backspace: return KeyCategory::Backspace;
        default: return KeyCategory::Other;
      }
    case Mode::Normal:
    case Mode::Visual:
      break;
  }
  if (ev.key == Key::Char && !ev.ctrl && input_.prefix() != 0) return KeyCategory::PrefixArg;
  switch (ev.key) {
    case Key::Left: case Key::Right: case Key::Up: case Key::Down: case Key::Home: case Key::End:
      return KeyCategory::Motion;
    case Key::Char: break;
    default: return KeyCategory::Other;
  }
  if (ev.ctrl) return (mode_ == Mode::Normal && ev.ch == 'r') ? KeyCategory::History : KeyCategory::Other;
  char c = ev.ch;
  if ((c >= '1' && c <= '9') || (c == '0' && input_.has_count())) return KeyCategory::Digit;
  if (in_set("hjklwbe0^$G{}fFg", c)) return KeyCategory::Motion;
  if (in_set("dcy", c)) return KeyCategory::Operator;
  if (mode_ == Mode::Visual) {
    if (c == 'x') return KeyCategory::Operator;
    if (c == 'v') return KeyCategory::ModeSwitch;
    return KeyCategory::Other;
  }
  if (in_set("xXDpP", c)) return KeyCategory::Edit;
  if (in_set("iaIAoOv:", c)) return KeyCategory::ModeSwitch;
  if (c == 'u') return KeyCategory::History;
  return KeyCategory::Other;
}

KeyResult Editor::handle_key(const KeyEvent& ev) {
  if (mode_ != Mode::Command && !input_.pending()) message_.clear();
  KeyCategory cat = classify(ev);
  Handler h = table()[static_cast<size_t>(mode_)][static_cast<size_t>(cat)];
  KeyResult r = (this->*h)(ev);
  if (r != KeyResult::Pending) input_.reset();
  if (mode_ != Mode::Command) cursors_.clamp(doc_.buf, mode_ == Mode::Insert);
  sync_highlight();
  if (ev.key == Key::Char) {
    VLOG(2) << "key '" << ev.ch << "'" << (ev.ctrl ? " ctrl" : "") << " mode=" << mode_name(mode_)
            << " result=" << static_cast<int>(r);
  } else {
    // special keys carry ch == 0
    VLOG(2) << "key " << static_cast<int>(ev.key) << " mode=" << mode_name(mode_)
            << " result=" << static_cast<int>(r);
  }
  return r;
}

KeyResult Editor::feed(std::string_view keys) {
  KeyResult last = KeyResult::Ignored;
  for (const auto& ev : parse_keys(keys)) last = handle_key(ev);
  return last;
}

void Editor::sync_highlight() {
  uint64_t rev = doc_.buf.revision();
  if (rev == highlighted_rev_) return;
  highlighted_rev_ = rev;
  highlighter_.submit(doc_.buf.text(), rev);
}

/* ---------- edit primitives ---------- */

bool Editor::insert_at(const Position& at, std::string_view text) {
  CursorSnapshot before = cursors_.snapshot();
  EditOp applied;
  EditError err = doc_.buf.insert(at, text, applied);
  if (err != EditError::None) {
    message_ = std::string(describe(err));
    LOG(WARNING) << "insert at " << at.row << ":" << at.col << " failed: " << describe(err);
    return false;
  }
  doc_.um.record(applied, before, cursors_.snapshot());
  return true;
}

bool Editor::erase_range(const Range& r) {
  CursorSnapshot before = cursors_.snapshot();
  EditOp applied;
  EditError err = doc_.buf.erase(r, applied);
  if (err != EditError::None) {
    message_ = std::string(describe(err));
    LOG(WARNING) << "erase " << r.start.row << ":" << r.start.col << "-" << r.end.row << ":" << r.end.col
                 << " failed: " << describe(err);
    return false;
  }
  doc_.um.record(applied, before, cursors_.snapshot());
  return true;
}

void Editor::yank_range(const Range& r, bool linewise) {
  reg_.linewise = linewise;
  if (linewise) {
    reg_.lines.clear();
    for (int row = r.start.row; row <= r.end.row; ++row) reg_.lines.push_back(doc_.buf.line(row));
  } else {
    reg_.lines = split_lines(doc_.buf.text_range(r));
  }
}

std::string Editor::indent_of(int row) const {
  std::string s = doc_.buf.line(row);
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return s.substr(0, i);
}

void Editor::enter_insert() {
  doc_.um.close_group();
  cursors_.clear_selection();
  mode_ = Mode::Insert;
}

void Editor::enter_normal() {
  cursors_.clear_selection();
  mode_ = Mode::Normal;
}

void Editor::move_to_line(int row) {
  doc_.um.close_group();
  row = std::clamp(row, 0, doc_.buf.line_count() - 1);
  cursors_.set_position(CursorSet::motion_target(doc_.buf, {row, 0}, Direction::Forward, Unit::FirstNonBlank,
                                                 false, 0));
}

void Editor::apply_operator(Operator op, Range r, bool linewise) {
  TextBuffer& buf = doc_.buf;
  yank_range(r, linewise);
  if (op == Operator::Yank) {
    Position to = linewise ? Position{r.start.row, cursors_.active().pos.col} : r.start;
    if (!linewise || cursors_.active().pos.row != r.start.row) cursors_.set_position(to);
    if (linewise && reg_.lines.size() > 2) message_ = std::to_string(reg_.lines.size()) + " lines yanked";
    return;
  }

  doc_.um.begin_group(cursors_.snapshot());
  if (linewise) {
    int r0 = r.start.row, r1 = r.end.row;
    if (op == Operator::Change) {
      std::string indent = opts_.auto_indent ? indent_of(r0) : std::string();
      erase_range({{r0, 0}, {r1, buf.line_length(r1)}});
      if (!indent.empty()) insert_at({r0, 0}, indent);
      cursors_.set_position({r0, static_cast<int>(indent.size())});
      mode_ = Mode::Insert;
      return;
    }
    int last = buf.line_count() - 1;
    Range del;
    if (r1 < last) del = {{r0, 0}, {r1 + 1, 0}};
    else if (r0 > 0) del = {{r0 - 1, buf.line_length(r0 - 1)}, {r1, buf.line_length(r1)}};
    else del = {{0, 0}, {r1, buf.line_length(r1)}};
    erase_range(del);
    move_to_line(std::min(r0, buf.line_count() - 1));
    doc_.um.commit_group(cursors_.snapshot());
    if (r1 - r0 + 1 > 2) message_ = std::to_string(r1 - r0 + 1) + " fewer lines";
    return;
  }

  erase_range(r);
  cursors_.set_position(r.start);
  if (op == Operator::Change) {
    mode_ = Mode::Insert;
    return;
  }
  doc_.um.commit_group(cursors_.snapshot());
}

Range Editor::visual_range() const {
  Range sel = cursors_.active().selection();
  const TextBuffer& buf = doc_.buf;
  Position e = sel.end;
  if (e.col < buf.line_length(e.row)) e.col++;
  else if (e.row + 1 < buf.line_count()) e = {e.row + 1, 0};
  return {sel.start, e};
}

bool Editor::paste(bool after, size_t count) {
  if (reg_.empty()) {
    message_ = "Nothing in register";
    return false;
  }
  TextBuffer& buf = doc_.buf;
  Position pos = cursors_.active().pos;
  doc_.um.begin_group(cursors_.snapshot());
  if (reg_.linewise) {
    std::string block;
    for (size_t i = 0; i < count; ++i) {
      for (const auto& l : reg_.lines) { block += l; block.push_back('\n'); }
    }
    int target = pos.row;
    if (after) {
      target = pos.row + 1;
      if (pos.row == buf.line_count() - 1) {
        block.pop_back();
        insert_at({pos.row, buf.line_length(pos.row)}, "\n" + block);
      } else {
        insert_at({pos.row + 1, 0}, block);
      }
    } else {
      insert_at({pos.row, 0}, block);
    }
    move_to_line(target);
  } else {
    std::string text;
    for (size_t i = 0; i < count; ++i) text += reg_.joined();
    Position at = pos;
    if (after && buf.line_length(pos.row) > 0) at.col = std::min(pos.col + 1, buf.line_length(pos.row));
    insert_at(at, text);
    Position end = advance_position(at, text);
    cursors_.set_position({end.row, std::max(0, end.col - 1)});
  }
  doc_.um.commit_group(cursors_.snapshot());
  return true;
}

void Editor::open_line(bool below) {
  TextBuffer& buf = doc_.buf;
  int row = cursors_.active().pos.row;
  std::string indent = opts_.auto_indent ? indent_of(row) : std::string();
  doc_.um.begin_group(cursors_.snapshot());
  if (below) {
    insert_at({row, buf.line_length(row)}, "\n" + indent);
    cursors_.set_position({row + 1, static_cast<int>(indent.size())});
  } else {
    insert_at({row, 0}, indent + "\n");
    cursors_.set_position({row, static_cast<int>(indent.size())});
  }
  cursors_.clear_selection();
  mode_ = Mode::Insert;
}

bool Editor::undo(size_t count) {
  for (size_t i = 0; i < count; ++i) {
    EditError err = doc_.um.undo(doc_.buf, cursors_);
    if (err == EditError::EmptyHistory) {
      if (i == 0) {
        message_ = "Already at oldest change";
        return false;
      }
      break;
    }
    if (err != EditError::None) {
      message_ = "undo failed: " + std::string(describe(err));
      return false;
    }
  }
  return true;
}

bool Editor::redo(size_t count) {
  for (size_t i = 0; i < count; ++i) {
    EditError err = doc_.um.redo(doc_.buf, cursors_);
    if (err == EditError::EmptyHistory) {
      if (i == 0) {
        message_ = "Already at newest change";
        return false;
      }
      break;
    }
    if (err != EditError::None) {
      message_ = "redo failed: " + std::string(describe(err));
      return false;
    }
  }
  return true;
}

/* ---------- Normal / Visual ---------- */

KeyResult Editor::ignore(const KeyEvent&) { return KeyResult::Ignored; }

KeyResult Editor::normal_escape(const KeyEvent&) {
  return input_.pending() ? KeyResult::Applied : KeyResult::Ignored;
}

KeyResult Editor::count_digit(const KeyEvent& ev) {
  input_.consume_digit(ev.ch);
  return KeyResult::Pending;
}

bool Editor::motion_for_key(const KeyEvent& ev, Motion& m) const {
  char c = 0;
  switch (ev.key) {
    case Key::Char: c = ev.ch; break;
    case Key::Left: c = 'h'; break;
    case Key::Right: c = 'l'; break;
    case Key::Up: c = 'k'; break;
    case Key::Down: c = 'j'; break;
    case Key::Home: c = '0'; break;
    case Key::End: c = '$'; break;
    default: return false;
  }
  switch (c) {
    case 'h': m = {Direction::Backward, Unit::Character, false, false}; break;
    case 'l': m = {Direction::Forward, Unit::Character, false, false}; break;
    case 'j': m = {Direction::Forward, Unit::Line, true, false}; break;
    case 'k': m = {Direction::Backward, Unit::Line, true, false}; break;
    case 'w': m = {Direction::Forward, Unit::Word, false, false}; break;
    case 'b': m = {Direction::Backward, Unit::Word, false, false}; break;
    case 'e': m = {Direction::Forward, Unit::WordEnd, false, true}; break;
    case '0': m = {Direction::Backward, Unit::LineBoundary, false, false}; break;
    case '^': m = {Direction::Forward, Unit::FirstNonBlank, false, false}; break;
    case '$': m = {Direction::Forward, Unit::LineBoundary, false, false}; break;
    case 'G': m = {Direction::Forward, Unit::Document, true, false}; break;
    case '{': m = {Direction::Backward, Unit::Paragraph, false, false}; break;
    case '}': m = {Direction::Forward, Unit::Paragraph, false, false}; break;
    default: return false;
  }
  return true;
}

KeyResult Editor::motion_key(const KeyEvent& ev) {
  if (ev.is_char('g') || ev.is_char('f') || ev.is_char('F')) {
    input_.set_prefix(ev.ch);
    return KeyResult::Pending;
  }
  Motion m;
  if (!motion_for_key(ev, m)) return KeyResult::Ignored;
  bool has_count = input_.has_count();
  size_t count = input_.pending_operator() != Operator::None ? input_.take_operator_count() : input_.take_count();
  return run_motion(m, count, has_count);
}

KeyResult Editor::prefix_arg(const KeyEvent& ev) {
  char p = input_.prefix();
  input_.set_prefix(0);
  bool has_count = input_.has_count();
  size_t count = input_.pending_operator() != Operator::None ? input_.take_operator_count() : input_.take_count();
  if (p == 'g') {
    if (ev.ch != 'g') return KeyResult::Ignored;
    Motion m{Direction::Backward, Unit::Document, true, false};
    return run_motion(m, count, has_count);
  }
  if (p == 'f' || p == 'F') return run_find(ev.ch, p == 'f' ? Direction::Forward : Direction::Backward, count);
  return KeyResult::Ignored;
}

KeyResult Editor::run_motion(const Motion& motion, size_t count, bool has_count) {
  const TextBuffer& buf = doc_.buf;
  Operator op = input_.pending_operator();
  Motion m = motion;
  Cursor& cur = cursors_.active();
  Position from = cur.pos;
  bool past_end = op != Operator::None;
  int len = buf.line_length(from.row);

  // cw acts like ce on a word
  if (op == Operator::Change && m.unit == Unit::Word && m.dir == Direction::Forward && from.col < len &&
      !std::isspace(static_cast<unsigned char>(buf.line(from.row)[from.col]))) {
    m.unit = Unit::WordEnd;
    m.inclusive = true;
  }

  Position to = from;
  if (m.unit == Unit::Document) {
    int row = has_count ? static_cast<int>(std::min<size_t>(count, buf.line_count())) - 1
                        : (m.dir == Direction::Forward ? buf.line_count() - 1 : 0);
    to = CursorSet::motion_target(buf, {row, 0}, Direction::Forward, Unit::FirstNonBlank, past_end, 0);
  } else {
    for (size_t i = 0; i < count; ++i) {
      Position next = CursorSet::motion_target(buf, to, m.dir, m.unit, past_end, cur.want_col);
      if (next == to) break;
      to = next;
    }
  }

  if (op == Operator::None) {
    cur.pos = to;
    if (m.unit == Unit::LineBoundary && m.dir == Direction::Forward) cur.want_col = std::numeric_limits<int>::max();
    else if (m.unit != Unit::Line) cur.want_col = to.col;
    return KeyResult::Applied;
  }

  if (m.linewise) {
    if (m.unit == Unit::Line && to.row == from.row) return KeyResult::Rejected;
    apply_operator(op, {std::min(from, to), std::max(from, to)}, true);
    return KeyResult::Applied;
  }
  // an operator over w stops at the end of the line the last word is on
  if (m.unit == Unit::Word && m.dir == Direction::Forward && to.row > from.row) {
    Position eol{to.row - 1, buf.line_length(to.row - 1)};
    if (from < eol) to = eol;
  }
  Range r{std::min(from, to), std::max(from, to)};
  if (m.inclusive) r.end.col = std::min(r.end.col + 1, buf.line_length(r.end.row));
  if (r.empty()) return KeyResult::Rejected;
  apply_operator(op, r, false);
  return KeyResult::Applied;
}

KeyResult Editor::run_find(char target, Direction dir, size_t count) {
  Operator op = input_.pending_operator();
  Position from = cursors_.active().pos;
  for (size_t i = 0; i < count; ++i) {
    if (!cursors_.find_in_line(doc_.buf, target, dir)) {
      cursors_.set_position(from);
      return KeyResult::Rejected;
    }
  }
  if (op == Operator::None) return KeyResult::Applied;
  Position to = cursors_.active().pos;
  cursors_.set_position(from);
  Range r = dir == Direction::Forward ? Range{from, {to.row, to.col + 1}} : Range{to, from};
  apply_operator(op, r, false);
  return KeyResult::Applied;
}

KeyResult Editor::operator_key_pressed(const KeyEvent& ev) {
  Operator op = ev.ch == 'd' ? Operator::Delete : ev.ch == 'c' ? Operator::Change : Operator::Yank;
  if (input_.consume_double(ev.ch)) {
    size_t count = input_.take_operator_count();
    int r0 = cursors_.active().pos.row;
    int r1 = static_cast<int>(std::min<size_t>(r0 + count - 1, doc_.buf.line_count() - 1));
    apply_operator(op, {{r0, 0}, {r1, doc_.buf.line_length(r1)}}, true);
    return KeyResult::Applied;
  }
  if (input_.pending_operator() != Operator::None) return KeyResult::Ignored;
  input_.set_operator(op, input_.take_count());
  return KeyResult::Pending;
}

KeyResult Editor::normal_edit(const KeyEvent& ev) {
  size_t count = input_.take_count();
  const TextBuffer& buf = doc_.buf;
  Position pos = cursors_.active().pos;
  int len = buf.line_length(pos.row);
  int n = static_cast<int>(std::min<size_t>(count, static_cast<size_t>(std::numeric_limits<int>::max())));
  switch (ev.ch) {
    case 'x':
      if (len == 0) return KeyResult::Rejected;
      apply_operator(Operator::Delete, {pos, {pos.row, pos.col + std::min(n, len - pos.col)}}, false);
      break;
    case 'X':
      if (pos.col == 0) return KeyResult::Rejected;
      apply_operator(Operator::Delete, {{pos.row, std::max(0, pos.col - n)}, pos}, false);
      break;
    case 'D':
      if (pos.col >= len) return KeyResult::Rejected;
      apply_operator(Operator::Delete, {pos, {pos.row, len}}, false);
      break;
    case 'p':
    case 'P':
      if (!paste(ev.ch == 'p', count)) return KeyResult::Rejected;
      break;
    default:
      return KeyResult::Ignored;
  }
  return KeyResult::Applied;
}

KeyResult Editor::normal_mode_switch(const KeyEvent& ev) {
  const TextBuffer& buf = doc_.buf;
  Position pos = cursors_.active().pos;
  switch (ev.ch) {
    case 'i':
      enter_insert();
      break;
    case 'a':
      enter_insert();
      cursors_.set_position({pos.row, std::min(pos.col + 1, buf.line_length(pos.row))});
      break;
    case 'I':
      enter_insert();
      cursors_.set_position(CursorSet::motion_target(buf, pos, Direction::Forward, Unit::FirstNonBlank, true, 0));
      break;
    case 'A':
      enter_insert();
      cursors_.set_position({pos.row, buf.line_length(pos.row)});
      break;
    case 'o':
    case 'O':
      open_line(ev.ch == 'o');
      break;
    case 'v':
      doc_.um.close_group();
      mode_ = Mode::Visual;
      cursors_.start_selection();
      break;
    case ':':
      doc_.um.close_group();
      mode_ = Mode::Command;
      cmdline_.clear();
      break;
    default:
      return KeyResult::Ignored;
  }
  return KeyResult::Applied;
}

KeyResult Editor::history_key(const KeyEvent& ev) {
  size_t count = input_.take_count();
  bool ok = ev.ctrl ? redo(count) : undo(count);
  return ok ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::visual_escape(const KeyEvent&) {
  enter_normal();
  return KeyResult::Applied;
}

KeyResult Editor::visual_operator(const KeyEvent& ev) {
  Operator op = Operator::Delete;
  if (ev.ch == 'c') op = Operator::Change;
  else if (ev.ch == 'y') op = Operator::Yank;
  Range r = visual_range();
  enter_normal();
  if (r.empty()) return KeyResult::Rejected;
  apply_operator(op, r, false);
  return KeyResult::Applied;
}

/* ---------- Insert ---------- */

KeyResult Editor::insert_escape(const KeyEvent&) {
  doc_.um.commit_group(cursors_.snapshot());
  mode_ = Mode::Normal;
  Position pos = cursors_.active().pos;
  if (pos.col > 0) cursors_.set_position({pos.row, pos.col - 1});
  return KeyResult::Applied;
}

KeyResult Editor::insert_text(const KeyEvent& ev) {
  return insert_at(cursors_.active().pos, std::string(1, ev.ch)) ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::insert_enter(const KeyEvent&) {
  Position pos = cursors_.active().pos;
  std::string text = "\n";
  if (opts_.auto_indent) {
    std::string indent = indent_of(pos.row);
    text += indent.substr(0, std::min<size_t>(indent.size(), pos.col));
  }
  return insert_at(pos, text) ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::insert_tab(const KeyEvent&) {
  Position pos = cursors_.active().pos;
  int width = std::max(1, opts_.tab_width);
  std::string text = opts_.expand_tab ? std::string(width - pos.col % width, ' ') : std::string("\t");
  return insert_at(pos, text) ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::insert_backspace(const KeyEvent&) {
  Position pos = cursors_.active().pos;
  if (pos.col > 0) return erase_range({{pos.row, pos.col - 1}, pos}) ? KeyResult::Applied : KeyResult::Rejected;
  if (pos.row == 0) return KeyResult::Ignored;
  Range join{{pos.row - 1, doc_.buf.line_length(pos.row - 1)}, pos};
  return erase_range(join) ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::insert_delete(const KeyEvent&) {
  Position pos = cursors_.active().pos;
  const TextBuffer& buf = doc_.buf;
  if (pos.col < buf.line_length(pos.row)) {
    return erase_range({pos, {pos.row, pos.col + 1}}) ? KeyResult::Applied : KeyResult::Rejected;
  }
  if (pos.row + 1 >= buf.line_count()) return KeyResult::Ignored;
  return erase_range({pos, {pos.row + 1, 0}}) ? KeyResult::Applied : KeyResult::Rejected;
}

KeyResult Editor::insert_motion(const KeyEvent& ev) {
  doc_.um.close_group();
  switch (ev.key) {
    case Key::Left: cursors_.move(doc_.buf, Direction::Backward, Unit::Character, true); break;
    case Key::Right: cursors_.move(doc_.buf, Direction::Forward, Unit::Character, true); break;
    case Key::Up: cursors_.move(doc_.buf, Direction::Backward, Unit::Line, true); break;
    case Key::Down: cursors_.move(doc_.buf, Direction::Forward, Unit::Line, true); break;
    case Key::Home: cursors_.move(doc_.buf, Direction::Backward, Unit::LineBoundary, true); break;
    case Key::End: cursors_.move(doc_.buf, Direction::Forward, Unit::LineBoundary, true); break;
    default: return KeyResult::Ignored;
  }
  return KeyResult::Applied;
}

/* ---------- Command ---------- */

KeyResult Editor::command_escape(const KeyEvent&) {
  cmdline_.clear();
  mode_ = Mode::Normal;
  return KeyResult::Applied;
}

KeyResult Editor::command_text(const KeyEvent& ev) {
  cmdline_.push_back(ev.ch);
  return KeyResult::Applied;
}

KeyResult Editor::command_backspace(const KeyEvent&) {
  if (cmdline_.empty()) {
    mode_ = Mode::Normal;
    return KeyResult::Applied;
  }
  cmdline_.pop_back();
  return KeyResult::Applied;
}

KeyResult Editor::command_enter(const KeyEvent&) {
  std::string line = cmdline_;
  cmdline_.clear();
  mode_ = Mode::Normal;
  return execute_command(line) ? KeyResult::Applied : KeyResult::Rejected;
}

/* ---------- rendering boundary ---------- */

std::vector<LineView> Editor::visible_lines(int top, int count) const {
  std::vector<LineView> out;
  const TextBuffer& buf = doc_.buf;
  auto hl = highlighter_.current();
  int end = std::min(top + count, buf.line_count());
  for (int r = std::max(0, top); r < end; ++r) {
    LineView lv;
    lv.row = r;
    lv.text = buf.line(r);
    lv.byte_start = buf.offset_for({r, 0});
    int len = static_cast<int>(lv.text.size());
    for (const auto& c : cursors_.all()) {
      if (c.pos.row == r) lv.cursor_cols.push_back(c.pos.col);
      if (!c.anchor) continue;
      Range s = c.selection();
      if (r < s.start.row || r > s.end.row) continue;
      int limit = std::max(len, 1);
      int c0 = r == s.start.row ? s.start.col : 0;
      int c1 = r == s.end.row ? s.end.col + 1 : limit;
      c1 = std::min(c1, limit);
      if (c0 < c1) lv.selections.emplace_back(c0, c1);
    }
    if (hl) {
      size_t ls = lv.byte_start, le = ls + static_cast<size_t>(len);
      auto it = std::partition_point(hl->spans.begin(), hl->spans.end(),
                                     [&](const HighlightSpan& sp) { return sp.end <= ls; });
      for (; it != hl->spans.end() && it->start < le; ++it) {
        lv.spans.push_back({std::max(it->start, ls) - ls, std::min(it->end, le) - ls, it->category});
      }
    }
    out.push_back(std::move(lv));
  }
  return out;
}

std::string Editor::status_line() const {
  if (mode_ == Mode::Command) return ":" + cmdline_;
  const Position& p = cursors_.active().pos;
  std::string s(mode_name(mode_));
  s += "  ";
  s += doc_.file_path ? doc_.file_path->string() : std::string("[no file]");
  if (doc_.modified) s += " [+]";
  s += "  " + std::to_string(p.row + 1) + ":" + std::to_string(p.col + 1);
  s += "  " + std::string(doc_.buf.backend_name());
  HighlightStatus hs = highlighter_.status();
  if (hs.error != EditError::None) s += "  [highlight: " + hs.message + "]";
  if (!message_.empty()) s += "  | " + message_;
  return s;
}

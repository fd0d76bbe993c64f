#include "input.hpp"
#include <limits>
#include <cctype>
#include <string>

std::vector<KeyEvent> parse_keys(std::string_view keys) {
  std::vector<KeyEvent> out;
  size_t i = 0;
  while (i < keys.size()) {
    if (keys[i] == '<') {
      size_t close = keys.find('>', i + 1);
      if (close != std::string_view::npos && close > i + 1) {
        std::string name(keys.substr(i + 1, close - i - 1));
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        KeyEvent ev;
        if (name == "esc") ev = KeyEvent::special(Key::Escape);
        else if (name == "cr" || name == "enter") ev = KeyEvent::special(Key::Enter);
        else if (name == "bs") ev = KeyEvent::special(Key::Backspace);
        else if (name == "tab") ev = KeyEvent::special(Key::Tab);
        else if (name == "del") ev = KeyEvent::special(Key::Delete);
        else if (name == "left") ev = KeyEvent::special(Key::Left);
        else if (name == "right") ev = KeyEvent::special(Key::Right);
        else if (name == "up") ev = KeyEvent::special(Key::Up);
        else if (name == "down") ev = KeyEvent::special(Key::Down);
        else if (name == "home") ev = KeyEvent::special(Key::Home);
        else if (name == "end") ev = KeyEvent::special(Key::End);
        else if (name == "lt") ev = KeyEvent::character('<');
        else if (name.size() == 3 && name[0] == 'c' && name[1] == '-') ev = KeyEvent::control(name[2]);
        if (ev.key != Key::None) {
          out.push_back(ev);
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(KeyEvent::character(keys[i]));
    ++i;
  }
  return out;
}

char operator_key(Operator op) {
  switch (op) {
    case Operator::Delete: return 'd';
    case Operator::Change: return 'c';
    case Operator::Yank: return 'y';
    case Operator::None: break;
  }
  return 0;
}

bool Input::consume_digit(char ch) {
  static constexpr size_t kMaxCount = static_cast<size_t>(std::numeric_limits<int>::max());
  if (ch < '0' || ch > '9') return false;
  if (ch == '0' && pending_count_ == 0) return false;
  size_t d = static_cast<size_t>(ch - '0');
  // long counts saturate instead of wrapping
  pending_count_ = pending_count_ > (kMaxCount - d) / 10 ? kMaxCount : pending_count_ * 10 + d;
  return true;
}

bool Input::has_count() const {
  return pending_count_ > 0;
}

size_t Input::take_count() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c > 0 ? c : 1;
}

void Input::set_operator(Operator op, size_t count) {
  op_ = op;
  op_count_ = count;
}

size_t Input::take_operator_count() {
  size_t c = op_count_ * take_count();
  op_count_ = 1;
  return c;
}

bool Input::consume_double(char ch) const {
  return op_ != Operator::None && ch == operator_key(op_);
}

bool Input::pending() const {
  return pending_count_ > 0 || op_ != Operator::None || prefix_ != 0;
}

void Input::reset() {
  pending_count_ = 0;
  op_count_ = 1;
  op_ = Operator::None;
  prefix_ = 0;
}

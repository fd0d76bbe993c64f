#pragma once
#include <cstddef>
#include <string_view>
#include <vector>
/*
 * Input
 *
 * Purpose: key events plus the Normal/Visual pending state (count prefix,
 * operator, one-key prefixes such as g/f/F) with minimal state.
 * Extend: decoupled from concrete editing actions; Editor reads and resets it.
 */

enum class Key { None, Char, Escape, Enter, Backspace, Tab, Delete, Left, Right, Up, Down, Home, End };

struct KeyEvent {
  Key key = Key::None;
  char ch = 0;
  bool ctrl = false;

  static KeyEvent character(char c) { return {Key::Char, c, false}; }
  static KeyEvent control(char c) { return {Key::Char, c, true}; }
  static KeyEvent special(Key k) { return {k, 0, false}; }
  bool is_char(char c) const { return key == Key::Char && !ctrl && ch == c; }
};

/* "ihi<Esc>", "<C-r>", "<CR>", "<BS>", "<Tab>", "<Del>", "<Left>" ... */
std::vector<KeyEvent> parse_keys(std::string_view keys);

enum class Operator { None, Delete, Change, Yank };

class Input {
public:
  bool consume_digit(char ch);
  bool has_count() const;
  /* pending count, or 1 when none was typed */
  size_t take_count();
  void set_operator(Operator op, size_t count);
  Operator pending_operator() const { return op_; }
  /* count typed before the operator times the count typed after it */
  size_t take_operator_count();
  bool consume_double(char ch) const;
  void set_prefix(char ch) { prefix_ = ch; }
  char prefix() const { return prefix_; }
  bool pending() const;
  void reset();
private:
  size_t pending_count_ = 0;
  size_t op_count_ = 1;
  Operator op_ = Operator::None;
  char prefix_ = 0;
};

char operator_key(Operator op);

#pragma once
/*
 * EditOp
 *
 * Purpose: one atomic, self-inverting change (insert or delete of a run).
 * Note: a delete carries the removed text so its inverse can re-insert it.
 */
#include <string>
#include <string_view>
#include <cstddef>
#include "types.hpp"

struct EditOp {
  enum Kind { Insert, Delete } kind = Insert;
  Position at;       // start of the run
  Position end;      // end of the run while it is present in the document
  size_t offset = 0; // byte offset of `at`
  std::string text;

  EditOp inverse() const {
    EditOp r = *this;
    r.kind = (kind == Insert) ? Delete : Insert;
    return r;
  }
  Range range() const { return {at, end}; }
  size_t length() const { return text.size(); }
};

/* position reached after placing `text` at `at` */
inline Position advance_position(const Position& at, std::string_view text) {
  Position p = at;
  for (char c : text) {
    if (c == '\n') { p.row++; p.col = 0; }
    else p.col++;
  }
  return p;
}

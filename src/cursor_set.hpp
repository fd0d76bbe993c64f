#pragma once
/*
 * CursorSet
 *
 * Purpose: insertion points (one active) with optional selection anchors.
 * Invariant: every cursor denotes a valid document position; positions are
 * shifted by on_buffer_mutated() from inside the buffer's mutation path.
 */
#include <optional>
#include <vector>
#include <cstddef>
#include "types.hpp"
#include "edit_op.hpp"

class TextBuffer;

enum class Direction { Backward, Forward };
enum class Unit { Character, Word, WordEnd, Line, LineBoundary, FirstNonBlank, Paragraph, Document };

struct Cursor {
  Position pos;
  std::optional<Position> anchor;
  int want_col = 0; // sticky column for vertical moves

  /* ordered [min, max) between anchor and position; empty without anchor */
  Range selection() const;
  bool operator==(const Cursor&) const = default;
};

struct CursorSnapshot {
  std::vector<Cursor> cursors;
  size_t active = 0;
  bool operator==(const CursorSnapshot&) const = default;
};

class CursorSet {
public:
  CursorSet();

  Cursor& active() { return cursors_[active_]; }
  const Cursor& active() const { return cursors_[active_]; }
  const std::vector<Cursor>& all() const { return cursors_; }
  size_t size() const { return cursors_.size(); }

  size_t add(const Position& p);
  void remove_secondary();
  void set_active(size_t idx);
  void set_position(const Position& p);

  void move(const TextBuffer& buf, Direction dir, Unit unit, bool past_end);
  bool find_in_line(const TextBuffer& buf, char ch, Direction dir);
  static Position motion_target(const TextBuffer& buf, const Position& from, Direction dir, Unit unit,
                                bool past_end, int want_col);

  void on_buffer_mutated(const EditOp& op);

  void start_selection();
  void clear_selection();
  void clamp(const TextBuffer& buf, bool past_end);

  CursorSnapshot snapshot() const;
  void restore(const CursorSnapshot& snap);

private:
  std::vector<Cursor> cursors_;
  size_t active_ = 0;
};

Position shift_position(const Position& p, const EditOp& op);
int max_col(const TextBuffer& buf, int row, bool past_end);

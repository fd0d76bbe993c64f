#pragma once
/*
 * UndoManager
 *
 * Purpose: undo/redo history of EditOp groups with cursor snapshots.
 * Grouping: consecutive word-character typing (or deleting) joins the open
 * group; whitespace, newlines, mode changes and cursor jumps close it.
 * Explicit groups (begin_group/commit_group) absorb every op recorded inside.
 */
#include <vector>
#include <cstddef>
#include "types.hpp"
#include "edit_op.hpp"
#include "cursor_set.hpp"

class TextBuffer;

struct UndoEntry {
  std::vector<EditOp> ops;
  CursorSnapshot pre;
  CursorSnapshot post;
};

class UndoManager {
public:
  void record(const EditOp& op, const CursorSnapshot& before, const CursorSnapshot& after);
  void begin_group(const CursorSnapshot& pre);
  void commit_group(const CursorSnapshot& post);
  void close_group();
  void clear();

  bool can_undo() const;
  bool can_redo() const;
  size_t undo_size() const { return undo_entries_.size(); }
  size_t redo_size() const { return redo_entries_.size(); }

  EditError undo(TextBuffer& buf, CursorSet& cursors);
  EditError redo(TextBuffer& buf, CursorSet& cursors);

private:
  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  bool explicit_ = false;
  UndoEntry current_;

  bool continues(const EditOp& op) const;
  EditError replay(TextBuffer& buf, const UndoEntry& e, bool backwards);
};

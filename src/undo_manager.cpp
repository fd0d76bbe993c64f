#include "undo_manager.hpp"
#include "text_buffer.hpp"
#include <algorithm>
#include <cctype>
#include <glog/logging.h>

static bool is_word_run(const std::string& s) {
  return !s.empty() && std::none_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool UndoManager::continues(const EditOp& op) const {
  if (current_.ops.empty()) return false;
  const EditOp& last = current_.ops.back();
  if (last.kind != op.kind) return false;
  if (!is_word_run(last.text) || !is_word_run(op.text)) return false;
  if (op.kind == EditOp::Insert) return op.at == last.end;
  // backspace walks left, forward delete stays put
  return op.end == last.at || op.at == last.at;
}

void UndoManager::record(const EditOp& op, const CursorSnapshot& before, const CursorSnapshot& after) {
  if (op.text.empty()) return;
  redo_entries_.clear();
  if (grouping_ && !explicit_ && !continues(op)) close_group();
  if (!grouping_) {
    grouping_ = true;
    current_.ops.clear();
    current_.pre = before;
  }
  current_.ops.push_back(op);
  current_.post = after;
}

void UndoManager::begin_group(const CursorSnapshot& pre) {
  close_group();
  grouping_ = true;
  explicit_ = true;
  current_.ops.clear();
  current_.pre = pre;
  current_.post = pre;
}

void UndoManager::commit_group(const CursorSnapshot& post) {
  if (!grouping_) return;
  current_.post = post;
  close_group();
}

void UndoManager::close_group() {
  if (!grouping_) return;
  grouping_ = false;
  explicit_ = false;
  if (!current_.ops.empty()) {
    VLOG(1) << "undo group committed ops=" << current_.ops.size();
    undo_entries_.push_back(std::move(current_));
  }
  current_ = UndoEntry{};
}

void UndoManager::clear() {
  undo_entries_.clear();
  redo_entries_.clear();
  grouping_ = false;
  explicit_ = false;
  current_ = UndoEntry{};
}

bool UndoManager::can_undo() const { return !undo_entries_.empty() || (grouping_ && !current_.ops.empty()); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

EditError UndoManager::replay(TextBuffer& buf, const UndoEntry& e, bool backwards) {
  size_t n = e.ops.size();
  auto op_at = [&](size_t i) -> const EditOp& { return backwards ? e.ops[n - 1 - i] : e.ops[i]; };
  for (size_t i = 0; i < n; ++i) {
    EditError err = buf.apply(backwards ? op_at(i).inverse() : op_at(i));
    if (err == EditError::None) continue;
    LOG(ERROR) << "history replay failed at op " << i << ": " << describe(err);
    // walk the applied prefix back so the buffer is as it was
    for (size_t j = i; j-- > 0;) {
      EditError back = buf.apply(backwards ? op_at(j) : op_at(j).inverse());
      if (back != EditError::None) {
        LOG(ERROR) << "history rollback failed at op " << j << ": " << describe(back);
        break;
      }
    }
    return err;
  }
  return EditError::None;
}

EditError UndoManager::undo(TextBuffer& buf, CursorSet& cursors) {
  close_group();
  if (undo_entries_.empty()) return EditError::EmptyHistory;
  CursorSnapshot held = cursors.snapshot();
  EditError err = replay(buf, undo_entries_.back(), true);
  if (err != EditError::None) {
    // the entry stays on the undo stack
    cursors.restore(held);
    return err;
  }
  UndoEntry e = std::move(undo_entries_.back());
  undo_entries_.pop_back();
  cursors.restore(e.pre);
  VLOG(1) << "undo ops=" << e.ops.size() << " remaining=" << undo_entries_.size();
  redo_entries_.push_back(std::move(e));
  return EditError::None;
}

EditError UndoManager::redo(TextBuffer& buf, CursorSet& cursors) {
  close_group();
  if (redo_entries_.empty()) return EditError::EmptyHistory;
  CursorSnapshot held = cursors.snapshot();
  EditError err = replay(buf, redo_entries_.back(), false);
  if (err != EditError::None) {
    cursors.restore(held);
    return err;
  }
  UndoEntry e = std::move(redo_entries_.back());
  redo_entries_.pop_back();
  cursors.restore(e.post);
  VLOG(1) << "redo ops=" << e.ops.size() << " remaining=" << redo_entries_.size();
  undo_entries_.push_back(std::move(e));
  return EditError::None;
}

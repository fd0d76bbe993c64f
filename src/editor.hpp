#pragma once
/*
 * Editor
 *
 * Purpose: the editing session. Owns the document (buffer + history),
 * cursors, mode, register, options, highlighter and status message, and
 * interprets keys through a (mode, key category) transition table.
 * Note: no terminal dependency; the front end feeds KeyEvents and reads
 * visible_lines() / status accessors to draw.
 */
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "types.hpp"
#include "config.hpp"
#include "text_buffer.hpp"
#include "cursor_set.hpp"
#include "undo_manager.hpp"
#include "input.hpp"
#include "cmd_registry.hpp"
#include "highlighter.hpp"

enum class KeyResult { Applied, Pending, Ignored, Rejected };

/* one screen line, ready to draw; columns are byte columns of `text` */
struct LineView {
  int row = 0;
  std::string text;
  size_t byte_start = 0;
  std::vector<int> cursor_cols;
  std::vector<std::pair<int, int>> selections; // [c0, c1)
  std::vector<HighlightSpan> spans;           // clipped, line-relative
};

struct Register {
  std::vector<std::string> lines;
  bool linewise = false;
  bool empty() const { return lines.empty(); }
  std::string joined() const;
};

class Editor {
public:
  Editor();
  explicit Editor(const std::optional<std::filesystem::path>& file);
  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  KeyResult handle_key(const KeyEvent& ev);
  /* feeds parse_keys(keys); returns the result of the last key */
  KeyResult feed(std::string_view keys);

  bool open(const std::filesystem::path& path);
  bool execute_command(const std::string& line);
  void load_rc();
  void load_rc(const std::filesystem::path& rc);

  std::vector<LineView> visible_lines(int top, int count) const;
  /* pushes the current text to the highlighter when the revision moved */
  void sync_highlight();

  Mode mode() const { return mode_; }
  const TextBuffer& buffer() const { return doc_.buf; }
  const CursorSet& cursors() const { return cursors_; }
  const UndoManager& history() const { return doc_.um; }
  const Register& reg() const { return reg_; }
  const Options& options() const { return opts_; }
  const std::string& message() const { return message_; }
  const std::string& cmdline() const { return cmdline_; }
  bool should_quit() const { return should_quit_; }
  bool modified() const { return doc_.modified; }
  const std::optional<std::filesystem::path>& file_path() const { return doc_.file_path; }
  const Highlighter& highlighter() const { return highlighter_; }
  std::string status_line() const;

private:
  struct Document {
    TextBuffer buf;
    UndoManager um;
    std::optional<std::filesystem::path> file_path;
    bool modified = false;
  };

  enum class KeyCategory { Escape, Digit, Motion, Operator, Edit, ModeSwitch, History, Text, Enter,
                           Backspace, Delete, Tab, PrefixArg, Other, Count_ };
  using Handler = KeyResult (Editor::*)(const KeyEvent&);
  static constexpr size_t kModes = 4;
  static constexpr size_t kCategories = static_cast<size_t>(KeyCategory::Count_);
  using Table = std::array<std::array<Handler, kCategories>, kModes>;

  struct Motion {
    Direction dir = Direction::Forward;
    Unit unit = Unit::Character;
    bool linewise = false;
    bool inclusive = false;
  };

  Document doc_;
  CursorSet cursors_;
  Mode mode_ = Mode::Normal;
  Input input_;
  CommandRegistry registry_;
  Register reg_;
  Options opts_;
  Highlighter highlighter_;
  std::string message_;
  std::string cmdline_;
  bool should_quit_ = false;
  bool registry_force_ = false; // command was given with a trailing !
  uint64_t highlighted_rev_ = 0;

  static const Table& table();
  KeyCategory classify(const KeyEvent& ev) const;

  // transition handlers
  KeyResult ignore(const KeyEvent& ev);
  KeyResult normal_escape(const KeyEvent& ev);
  KeyResult count_digit(const KeyEvent& ev);
  KeyResult motion_key(const KeyEvent& ev);
  KeyResult prefix_arg(const KeyEvent& ev);
  KeyResult operator_key_pressed(const KeyEvent& ev);
  KeyResult normal_edit(const KeyEvent& ev);
  KeyResult normal_mode_switch(const KeyEvent& ev);
  KeyResult history_key(const KeyEvent& ev);
  KeyResult insert_escape(const KeyEvent& ev);
  KeyResult insert_text(const KeyEvent& ev);
  KeyResult insert_enter(const KeyEvent& ev);
  KeyResult insert_tab(const KeyEvent& ev);
  KeyResult insert_backspace(const KeyEvent& ev);
  KeyResult insert_delete(const KeyEvent& ev);
  KeyResult insert_motion(const KeyEvent& ev);
  KeyResult visual_escape(const KeyEvent& ev);
  KeyResult visual_operator(const KeyEvent& ev);
  KeyResult command_escape(const KeyEvent& ev);
  KeyResult command_text(const KeyEvent& ev);
  KeyResult command_backspace(const KeyEvent& ev);
  KeyResult command_enter(const KeyEvent& ev);

  // motions and operators
  bool motion_for_key(const KeyEvent& ev, Motion& m) const;
  KeyResult run_motion(const Motion& m, size_t count, bool has_count);
  KeyResult run_find(char target, Direction dir, size_t count);
  void apply_operator(Operator op, Range r, bool linewise);
  Range visual_range() const;
  void move_to_line(int row);

  // edit primitives: record into history, report OutOfBounds in the status line
  bool insert_at(const Position& at, std::string_view text);
  bool erase_range(const Range& r);
  void yank_range(const Range& r, bool linewise);
  bool paste(bool after, size_t count);
  void open_line(bool below);
  void enter_insert();
  void enter_normal();
  std::string indent_of(int row) const;

  bool undo(size_t count);
  bool redo(size_t count);

  void register_commands();
  bool run_command(const std::string& raw);
  bool write_to(const std::optional<std::filesystem::path>& path);
  bool set_option(const std::string& arg);
  void reset_document();
};

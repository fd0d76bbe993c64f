#pragma once
/*
 * TextBuffer
 *
 * Purpose: document text addressed by (row, col) and by byte offset.
 * Mutations go through insert/erase/apply, which return the applied EditOp
 * and notify observers before returning (cursor shift, highlight staleness).
 * Note: always holds at least one (possibly empty) line.
 */
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <functional>
#include <cstdint>
#include "i_text_buffer_core.hpp"
#include "config.hpp"
#include "types.hpp"
#include "edit_op.hpp"
#if TB_BACKEND == TB_BACKEND_ROPE
#include "rope_text_buffer_core.hpp"
#else
#include "vector_text_buffer_core.hpp"
#endif

class TextBuffer {
public:
#if TB_BACKEND == TB_BACKEND_ROPE
  using CoreType = RopeTextBufferCore;
#else
  using CoreType = VectorTextBufferCore;
#endif
  static_assert(TextBufferCoreCRTPConcept<CoreType>, "Selected backend must satisfy CRTP concept");
  using Observer = std::function<void(const EditOp&)>;

  TextBuffer();
  explicit TextBuffer(std::string_view text);

  std::string_view backend_name() const;
  int line_count() const;
  std::string line(int r) const;
  int line_length(int r) const;
  size_t size() const;
  Position end_position() const;
  bool valid(const Position& p) const;
  size_t offset_for(const Position& p) const;
  Position position_for(size_t offset) const;
  std::string text() const;
  std::string text_range(const Range& r) const;
  uint64_t revision() const { return revision_; }

  EditError insert(const Position& at, std::string_view text, EditOp& applied);
  EditError erase(const Range& r, EditOp& applied, bool clamp = false);
  EditError apply(const EditOp& op);

  void add_observer(Observer fn);
  /* replaces the whole document; observers are not told (no EditOp), revision still moves */
  void init_from_text(std::string_view text);

  bool load_file(const std::filesystem::path& path, std::string& msg);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  CoreType core_;
  std::vector<Observer> observers_;
  uint64_t revision_ = 0;

  void ensure_not_empty();
  void notify(const EditOp& op);
};

std::vector<std::string> split_lines(std::string_view text);

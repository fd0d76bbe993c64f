#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include <string_view>
#include <span>
#include "i_text_buffer_core.hpp"

/* flat reference backend: O(1) line access, linear offset translation */
class VectorTextBufferCore : public TextBufferCoreCRTP<VectorTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  void do_init_from_lines(const std::vector<std::string>& lines) { lines_ = lines; }
  int do_line_count() const { return static_cast<int>(lines_.size()); }
  std::string do_get_line(int r) const {
    if (r < 0 || r >= static_cast<int>(lines_.size())) return std::string();
    return lines_[r];
  }
  size_t do_line_length(int r) const {
    if (r < 0 || r >= static_cast<int>(lines_.size())) return 0;
    return lines_[r].size();
  }

  void do_insert_line(size_t row, std::string_view s) {
    size_t pos = std::min(row, lines_.size());
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::string(s));
  }
  void do_insert_lines(size_t row, std::span<const std::string> ss) {
    size_t pos = std::min(row, lines_.size());
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), ss.begin(), ss.end());
  }
  void do_erase_line(size_t row) {
    if (row >= lines_.size()) return;
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row));
  }
  void do_erase_lines(size_t start_row, size_t end_row) {
    if (end_row < start_row) end_row = start_row;
    start_row = std::min(start_row, lines_.size());
    end_row = std::min(end_row, lines_.size());
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start_row),
                 lines_.begin() + static_cast<std::ptrdiff_t>(end_row));
  }
  void do_replace_line(size_t row, std::string_view s) {
    if (row >= lines_.size()) return;
    lines_[row] = std::string(s);
  }

  size_t do_line_offset(size_t row) const {
    size_t off = 0;
    size_t n = std::min(row, lines_.size());
    for (size_t i = 0; i < n; ++i) off += lines_[i].size() + 1;
    return off;
  }
  size_t do_row_at_offset(size_t offset) const {
    if (lines_.empty()) return 0;
    for (size_t i = 0; i < lines_.size(); ++i) {
      size_t span = lines_[i].size() + 1;
      if (offset < span) return i;
      offset -= span;
    }
    return lines_.size() - 1;
  }
  size_t do_total_bytes() const {
    if (lines_.empty()) return 0;
    return do_line_offset(lines_.size()) - 1;
  }
  std::string do_text() const {
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (i) out.push_back('\n');
      out += lines_[i];
    }
    return out;
  }

private:
  std::vector<std::string> lines_;
};

static_assert(TextBufferCoreCRTPConcept<VectorTextBufferCore>, "Vector backend must satisfy CRTP concept");

#include "text_buffer.hpp"
#include "file_io.hpp"
#include <algorithm>
#include <span>
#include <glog/logging.h>

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (true) {
    size_t pos = text.find('\n', st);
    if (pos == std::string_view::npos) { lines.emplace_back(text.substr(st)); break; }
    lines.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer::TextBuffer(std::string_view text) { init_from_text(text); }

std::string_view TextBuffer::backend_name() const { return core_.get_name(); }

int TextBuffer::line_count() const { return core_.line_count(); }
std::string TextBuffer::line(int r) const { return core_.get_line(r); }
int TextBuffer::line_length(int r) const { return static_cast<int>(core_.line_length(r)); }
size_t TextBuffer::size() const { return core_.total_bytes(); }

Position TextBuffer::end_position() const {
  int last = line_count() - 1;
  return {last, line_length(last)};
}

bool TextBuffer::valid(const Position& p) const {
  if (p.row < 0 || p.row >= line_count()) return false;
  return p.col >= 0 && p.col <= line_length(p.row);
}

size_t TextBuffer::offset_for(const Position& p) const {
  return core_.line_offset(static_cast<size_t>(p.row)) + static_cast<size_t>(p.col);
}

Position TextBuffer::position_for(size_t offset) const {
  offset = std::min(offset, size());
  size_t row = core_.row_at_offset(offset);
  size_t start = core_.line_offset(row);
  return {static_cast<int>(row), static_cast<int>(offset - start)};
}

std::string TextBuffer::text() const { return core_.text(); }

std::string TextBuffer::text_range(const Range& r) const {
  if (r.start.row == r.end.row) {
    std::string s = line(r.start.row);
    return s.substr(r.start.col, r.end.col - r.start.col);
  }
  std::string out = line(r.start.row).substr(r.start.col);
  for (int row = r.start.row + 1; row < r.end.row; ++row) {
    out.push_back('\n');
    out += line(row);
  }
  out.push_back('\n');
  out += line(r.end.row).substr(0, r.end.col);
  return out;
}

void TextBuffer::ensure_not_empty() {
  if (line_count() == 0) core_.insert_line(0, std::string_view());
}

void TextBuffer::notify(const EditOp& op) {
  ++revision_;
  for (auto& fn : observers_) fn(op);
}

void TextBuffer::add_observer(Observer fn) { observers_.push_back(std::move(fn)); }

void TextBuffer::init_from_text(std::string_view text) {
  core_.init_from_lines(split_lines(text));
  ensure_not_empty();
  ++revision_;
}

EditError TextBuffer::insert(const Position& at, std::string_view text, EditOp& applied) {
  if (!valid(at)) return EditError::OutOfBounds;
  applied = EditOp{EditOp::Insert, at, advance_position(at, text), offset_for(at), std::string(text)};
  if (text.empty()) return EditError::None;

  std::string cur = line(at.row);
  std::string tail = cur.substr(at.col);
  cur.resize(at.col);
  auto pieces = split_lines(text);
  if (pieces.size() == 1) {
    core_.replace_line(at.row, cur + pieces[0] + tail);
  } else {
    core_.replace_line(at.row, cur + pieces[0]);
    pieces.back() += tail;
    core_.insert_lines(at.row + 1, std::span<const std::string>(pieces).subspan(1));
  }
  notify(applied);
  return EditError::None;
}

EditError TextBuffer::erase(const Range& r, EditOp& applied, bool clamp) {
  Range range = r;
  if (clamp && range.end > end_position()) range.end = end_position();
  if (!valid(range.start) || !valid(range.end) || range.end < range.start) return EditError::OutOfBounds;
  applied = EditOp{EditOp::Delete, range.start, range.end, offset_for(range.start), text_range(range)};
  if (range.empty()) return EditError::None;

  std::string head = line(range.start.row).substr(0, range.start.col);
  std::string tail = line(range.end.row).substr(range.end.col);
  core_.replace_line(range.start.row, head + tail);
  if (range.end.row > range.start.row) core_.erase_lines(range.start.row + 1, range.end.row + 1);
  notify(applied);
  return EditError::None;
}

EditError TextBuffer::apply(const EditOp& op) {
  EditOp applied;
  if (op.kind == EditOp::Insert) return insert(op.at, op.text, applied);
  return erase(op.range(), applied);
}

bool TextBuffer::load_file(const std::filesystem::path& path, std::string& msg) {
  std::string data;
  if (!mmap_read_text(path, data, msg)) {
    LOG(WARNING) << msg;
    return false;
  }
  init_from_text(data);
  LOG(INFO) << "loaded " << path.string() << " lines=" << line_count() << " bytes=" << size()
            << " backend=" << backend_name();
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::string data = text();
  if (!write_file_atomic(path, data, msg)) return false;
  LOG(INFO) << "wrote " << path.string() << " bytes=" << data.size();
  return true;
}

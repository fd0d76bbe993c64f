#include "rope_text_buffer_core.hpp"
#include <algorithm>
#include <future>
#include <iterator>

static constexpr size_t LEAF_MAX_LINES = 128;
static constexpr size_t PARALLEL_BUILD_LINES = 4096;

void RopeTextBufferCore::recalc(Node* n) {
  if (!n) return;
  if (is_leaf(n)) {
    size_t b = 0;
    for (const auto& s : n->lines) b += s.size() + 1;
    n->lines_count = n->lines.size();
    n->bytes = b;
    n->height = 1;
    return;
  }
  n->lines_count = count_lines(n->left.get()) + count_lines(n->right.get());
  n->bytes = count_bytes(n->left.get()) + count_bytes(n->right.get());
  n->height = 1 + std::max(node_height(n->left.get()), node_height(n->right.get()));
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::rotate_left(NodePtr x) {
  auto y = std::move(x->right);
  auto T2 = std::move(y->left);
  y->left = std::move(x);
  y->left->right = std::move(T2);
  recalc(y->left.get());
  recalc(y.get());
  return y;
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::rotate_right(NodePtr y) {
  auto x = std::move(y->left);
  auto T2 = std::move(x->right);
  x->right = std::move(y);
  x->right->left = std::move(T2);
  recalc(x->right.get());
  recalc(x.get());
  return x;
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::balance(NodePtr n) {
  if (!n) return n;
  recalc(n.get());
  int bf = balance_factor(n.get());
  if (bf > 1) { // left heavy
    if (balance_factor(n->left.get()) < 0) {
      n->left = rotate_left(std::move(n->left));
    }
    return rotate_right(std::move(n));
  } else if (bf < -1) { // right heavy
    if (balance_factor(n->right.get()) > 0) {
      n->right = rotate_right(std::move(n->right));
    }
    return rotate_left(std::move(n));
  }
  return n;
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::make_leaf(std::vector<std::string>&& lines) {
  if (lines.empty()) return nullptr;
  auto n = std::make_unique<Node>();
  n->lines = std::move(lines);
  recalc(n.get());
  return n;
}

// AVL join: descend the taller side until heights are within one, rebalance on the way up.
RopeTextBufferCore::NodePtr RopeTextBufferCore::join(NodePtr a, NodePtr b) {
  if (!a) return b;
  if (!b) return a;
  int ha = node_height(a.get());
  int hb = node_height(b.get());
  if (ha > hb + 1) {
    a->right = join(std::move(a->right), std::move(b));
    return balance(std::move(a));
  }
  if (hb > ha + 1) {
    b->left = join(std::move(a), std::move(b->left));
    return balance(std::move(b));
  }
  if (is_leaf(a.get()) && is_leaf(b.get()) && a->lines.size() + b->lines.size() <= LEAF_MAX_LINES) {
    a->lines.insert(a->lines.end(), std::make_move_iterator(b->lines.begin()), std::make_move_iterator(b->lines.end()));
    recalc(a.get());
    return a;
  }
  auto p = std::make_unique<Node>();
  p->left = std::move(a);
  p->right = std::move(b);
  recalc(p.get());
  return p;
}

std::pair<RopeTextBufferCore::NodePtr, RopeTextBufferCore::NodePtr>
RopeTextBufferCore::split(NodePtr n, size_t k) {
  if (!n) return {nullptr, nullptr};
  if (k == 0) return {nullptr, std::move(n)};
  if (k >= n->lines_count) return {std::move(n), nullptr};
  if (is_leaf(n.get())) {
    auto mid = n->lines.begin() + static_cast<std::ptrdiff_t>(k);
    std::vector<std::string> left_lines(std::make_move_iterator(n->lines.begin()), std::make_move_iterator(mid));
    std::vector<std::string> right_lines(std::make_move_iterator(mid), std::make_move_iterator(n->lines.end()));
    return {make_leaf(std::move(left_lines)), make_leaf(std::move(right_lines))};
  }
  size_t left_count = count_lines(n->left.get());
  if (k < left_count) {
    auto [a, b] = split(std::move(n->left), k);
    return {std::move(a), join(std::move(b), std::move(n->right))};
  }
  if (k == left_count) return {std::move(n->left), std::move(n->right)};
  auto [a, b] = split(std::move(n->right), k - left_count);
  return {join(std::move(n->left), std::move(a)), std::move(b)};
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::build_balanced(std::span<const std::string> lines) {
  if (lines.empty()) return nullptr;
  if (lines.size() <= LEAF_MAX_LINES) {
    return make_leaf(std::vector<std::string>(lines.begin(), lines.end()));
  }
  size_t mid = lines.size() / 2;
  auto left = build_balanced(lines.subspan(0, mid));
  auto right = build_balanced(lines.subspan(mid));
  return join(std::move(left), std::move(right));
}

RopeTextBufferCore::NodePtr RopeTextBufferCore::build_balanced_parallel(std::span<const std::string> lines) {
  if (lines.size() <= PARALLEL_BUILD_LINES) return build_balanced(lines);
  size_t mid = lines.size() / 2;
  auto fut_left = std::async(std::launch::async, [lines, mid]{ return build_balanced(lines.subspan(0, mid)); });
  auto right = build_balanced(lines.subspan(mid));
  auto left = fut_left.get();
  return join(std::move(left), std::move(right));
}

const RopeTextBufferCore::Node* RopeTextBufferCore::leaf_for_row(const Node* n, size_t& r) {
  const Node* cur = n;
  while (cur && !is_leaf(cur)) {
    size_t lc = count_lines(cur->left.get());
    if (r < lc) { cur = cur->left.get(); continue; }
    r -= lc;
    cur = cur->right.get();
  }
  return cur;
}

void RopeTextBufferCore::replace_at(Node* n, size_t r, std::string_view s) {
  if (is_leaf(n)) {
    n->lines[r].assign(s.data(), s.size());
    recalc(n);
    return;
  }
  size_t lc = count_lines(n->left.get());
  if (r < lc) replace_at(n->left.get(), r, s);
  else replace_at(n->right.get(), r - lc, s);
  recalc(n);
}

void RopeTextBufferCore::append_text(const Node* n, std::string& out, bool& first) {
  if (!n) return;
  if (is_leaf(n)) {
    for (const auto& s : n->lines) {
      if (!first) out.push_back('\n');
      out += s;
      first = false;
    }
    return;
  }
  append_text(n->left.get(), out, first);
  append_text(n->right.get(), out, first);
}

void RopeTextBufferCore::do_init_from_lines(const std::vector<std::string>& lines) {
  root_ = build_balanced_parallel(std::span<const std::string>(lines));
}

int RopeTextBufferCore::do_line_count() const { return static_cast<int>(count_lines(root_.get())); }

std::string RopeTextBufferCore::do_get_line(int r) const {
  if (r < 0 || static_cast<size_t>(r) >= count_lines(root_.get())) return std::string();
  size_t idx = static_cast<size_t>(r);
  const Node* leaf = leaf_for_row(root_.get(), idx);
  return leaf ? leaf->lines[idx] : std::string();
}

size_t RopeTextBufferCore::do_line_length(int r) const {
  if (r < 0 || static_cast<size_t>(r) >= count_lines(root_.get())) return 0;
  size_t idx = static_cast<size_t>(r);
  const Node* leaf = leaf_for_row(root_.get(), idx);
  return leaf ? leaf->lines[idx].size() : 0;
}

void RopeTextBufferCore::do_insert_line(size_t row, std::string_view s) {
  size_t L = count_lines(root_.get()); if (row > L) row = L;
  auto [A, B] = split(std::move(root_), row);
  std::vector<std::string> single{std::string(s)};
  root_ = join(join(std::move(A), make_leaf(std::move(single))), std::move(B));
}

void RopeTextBufferCore::do_insert_lines(size_t row, std::span<const std::string> ss) {
  if (ss.empty()) return;
  size_t L = count_lines(root_.get()); if (row > L) row = L;
  auto [A, B] = split(std::move(root_), row);
  auto M = (ss.size() >= PARALLEL_BUILD_LINES) ? build_balanced_parallel(ss) : build_balanced(ss);
  root_ = join(join(std::move(A), std::move(M)), std::move(B));
}

void RopeTextBufferCore::do_erase_line(size_t row) {
  do_erase_lines(row, row + 1);
}

void RopeTextBufferCore::do_erase_lines(size_t start_row, size_t end_row) {
  size_t L = count_lines(root_.get());
  if (end_row < start_row) end_row = start_row;
  if (start_row >= L) return;
  if (end_row > L) end_row = L;
  auto [A, B] = split(std::move(root_), start_row);
  auto [M, C] = split(std::move(B), end_row - start_row);
  root_ = join(std::move(A), std::move(C));
}

void RopeTextBufferCore::do_replace_line(size_t row, std::string_view s) {
  if (row >= count_lines(root_.get())) return;
  replace_at(root_.get(), row, s);
}

size_t RopeTextBufferCore::do_line_offset(size_t row) const {
  size_t off = 0;
  const Node* cur = root_.get();
  while (cur) {
    if (is_leaf(cur)) {
      size_t n = std::min(row, cur->lines.size());
      for (size_t i = 0; i < n; ++i) off += cur->lines[i].size() + 1;
      return off;
    }
    size_t lc = count_lines(cur->left.get());
    if (row < lc) { cur = cur->left.get(); continue; }
    row -= lc;
    off += count_bytes(cur->left.get());
    cur = cur->right.get();
  }
  return off;
}

size_t RopeTextBufferCore::do_row_at_offset(size_t offset) const {
  size_t row = 0;
  const Node* cur = root_.get();
  while (cur) {
    if (is_leaf(cur)) {
      for (size_t i = 0; i < cur->lines.size(); ++i) {
        size_t span = cur->lines[i].size() + 1;
        if (offset < span) return row + i;
        offset -= span;
      }
      return row + cur->lines.size() - 1;
    }
    size_t lb = count_bytes(cur->left.get());
    if (offset < lb) { cur = cur->left.get(); continue; }
    offset -= lb;
    row += count_lines(cur->left.get());
    cur = cur->right.get();
  }
  return row;
}

size_t RopeTextBufferCore::do_total_bytes() const {
  size_t b = count_bytes(root_.get());
  return b ? b - 1 : 0;
}

std::string RopeTextBufferCore::do_text() const {
  std::string out;
  out.reserve(do_total_bytes());
  bool first = true;
  append_text(root_.get(), out, first);
  return out;
}

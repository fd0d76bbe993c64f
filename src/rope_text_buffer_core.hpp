#pragma once
#include <string>
#include <vector>
#include <memory>
#include <string_view>
#include <span>
#include <utility>
#include "i_text_buffer_core.hpp"

/*
 * RopeTextBufferCore
 *
 * Purpose: AVL tree of line leaves; every node aggregates its line count and
 * byte count, so line lookup and offset<->row translation are O(log n).
 * Note: only leaves carry lines; internal nodes always have two children.
 */
class RopeTextBufferCore : public TextBufferCoreCRTP<RopeTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "rope"; }

  void do_init_from_lines(const std::vector<std::string>& lines);
  int do_line_count() const;
  std::string do_get_line(int r) const;
  size_t do_line_length(int r) const;

  void do_insert_line(size_t row, std::string_view s);
  void do_insert_lines(size_t row, std::span<const std::string> ss);
  void do_erase_line(size_t row);
  void do_erase_lines(size_t start_row, size_t end_row); // end_row exclusive
  void do_replace_line(size_t row, std::string_view s);

  size_t do_line_offset(size_t row) const;
  size_t do_row_at_offset(size_t offset) const;
  size_t do_total_bytes() const;
  std::string do_text() const;

  int height() const { return node_height(root_.get()); }

private:
  struct Node {
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
    std::vector<std::string> lines; /* non-empty only for leaves */
    size_t lines_count = 0;         /* aggregated number of lines */
    size_t bytes = 0;               /* aggregated bytes, one newline per line */
    int height = 1;                 /* AVL height */
  };
  using NodePtr = std::unique_ptr<Node>;
  NodePtr root_;

  static bool is_leaf(const Node* n) { return !n->left && !n->right; }
  static size_t count_lines(const Node* n) { return n ? n->lines_count : 0; }
  static size_t count_bytes(const Node* n) { return n ? n->bytes : 0; }
  static int node_height(const Node* n) { return n ? n->height : 0; }
  static int balance_factor(const Node* n) { return n ? (node_height(n->left.get()) - node_height(n->right.get())) : 0; }
  static void recalc(Node* n);
  static NodePtr rotate_left(NodePtr x);
  static NodePtr rotate_right(NodePtr y);
  static NodePtr balance(NodePtr n);

  static NodePtr make_leaf(std::vector<std::string>&& lines);
  static NodePtr join(NodePtr a, NodePtr b);
  static std::pair<NodePtr, NodePtr> split(NodePtr n, size_t k);
  static NodePtr build_balanced(std::span<const std::string> lines);
  static NodePtr build_balanced_parallel(std::span<const std::string> lines);
  static const Node* leaf_for_row(const Node* n, size_t& r);
  static void replace_at(Node* n, size_t r, std::string_view s);
  static void append_text(const Node* n, std::string& out, bool& first);
};

static_assert(TextBufferCoreCRTPConcept<RopeTextBufferCore>, "Rope backend must satisfy CRTP concept");

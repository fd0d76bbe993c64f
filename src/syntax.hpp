#pragma once
/*
 * Syntax
 *
 * Purpose: language table over the tree-sitter grammars, whole-document
 * parsing, and the walk that turns a syntax tree into highlight spans.
 * Invariant: spans produced from a tree are ordered, non-overlapping and
 * cover [0, length) exactly; bytes no category claims are Text.
 * Note: no shared parser state; safe to call from the highlight worker thread.
 */
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <tree_sitter/api.h>

enum class HighlightCategory : uint8_t {
  Text, Comment, Keyword, String, Number, Constant, Type, Function, Operator, Punctuation, Preprocessor,
};
constexpr int kHighlightCategoryCount = 11;

std::string_view category_name(HighlightCategory c);

/* byte range [start, end) of the document */
struct HighlightSpan {
  size_t start = 0;
  size_t end = 0;
  HighlightCategory category = HighlightCategory::Text;
  bool operator==(const HighlightSpan&) const = default;
};

struct Language {
  std::string name;
  std::vector<std::string> extensions;
  const TSLanguage* grammar = nullptr; // null for plain text
  std::unordered_set<std::string> constants; // literal node types and identifiers shown as constants
  std::unordered_set<std::string> types;     // identifiers shown as types outside type positions
};

const Language& plain_text_language();
const Language& language_for_path(const std::optional<std::filesystem::path>& path);
const std::vector<Language>& known_languages();

struct TreeDeleter {
  void operator()(TSTree* t) const { ts_tree_delete(t); }
};

struct SyntaxTree {
  std::unique_ptr<TSTree, TreeDeleter> tree; // empty for plain text
  size_t length = 0;
  bool has_error = false; // parsed with recovered errors
};

/* rejects text containing NUL bytes or malformed UTF-8 */
bool validate_text(std::string_view text, std::string& msg);
/* fails on invalid text, a parser that returns no tree, or a tree with no
 * recoverable structure outside ERROR nodes */
bool parse_syntax(std::string_view text, const Language& lang, SyntaxTree& tree, std::string& msg);
std::vector<HighlightSpan> assign_categories(std::string_view text, const Language& lang, const SyntaxTree& tree);

#include "syntax.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>
#include <unordered_map>
#include <glog/logging.h>

extern "C" const TSLanguage* tree_sitter_cpp();
extern "C" const TSLanguage* tree_sitter_rust();
extern "C" const TSLanguage* tree_sitter_go();
extern "C" const TSLanguage* tree_sitter_javascript();
extern "C" const TSLanguage* tree_sitter_typescript();
extern "C" const TSLanguage* tree_sitter_tsx();
extern "C" const TSLanguage* tree_sitter_bash();

std::string_view category_name(HighlightCategory c) {
  switch (c) {
    case HighlightCategory::Text: return "text";
    case HighlightCategory::Comment: return "comment";
    case HighlightCategory::Keyword: return "keyword";
    case HighlightCategory::String: return "string";
    case HighlightCategory::Number: return "number";
    case HighlightCategory::Constant: return "constant";
    case HighlightCategory::Type: return "type";
    case HighlightCategory::Function: return "function";
    case HighlightCategory::Operator: return "operator";
    case HighlightCategory::Punctuation: return "punctuation";
    case HighlightCategory::Preprocessor: return "preprocessor";
  }
  return "text";
}

static std::vector<Language> build_languages() {
  std::vector<Language> v;
  auto add = [&](std::string name, std::vector<std::string> exts, const TSLanguage* grammar,
                 std::unordered_set<std::string> constants, std::unordered_set<std::string> types) {
    v.push_back({std::move(name), std::move(exts), grammar, std::move(constants), std::move(types)});
  };
  add("cpp", {"c", "h", "cc", "cpp", "cxx", "hpp", "hh", "hxx", "ipp"}, tree_sitter_cpp(),
      {"true", "false", "null", "nullptr", "NULL"},
      {"string", "string_view", "vector"});
  add("rust", {"rs"}, tree_sitter_rust(),
      {"true", "false", "None", "Some", "Ok", "Err"},
      {"String", "Vec", "Option", "Result", "Box", "Self"});
  add("go", {"go"}, tree_sitter_go(),
      {"true", "false", "nil", "iota"},
      {"error", "any"});
  // the TypeScript grammars extend the JavaScript one; node names are shared
  std::unordered_set<std::string> js_constants{"true", "false", "null", "undefined", "NaN", "Infinity"};
  std::unordered_set<std::string> js_types{"Array", "Promise", "Map", "Set", "Object"};
  add("javascript", {"js", "mjs", "cjs", "jsx"}, tree_sitter_javascript(), js_constants, js_types);
  add("typescript", {"ts", "mts", "cts"}, tree_sitter_typescript(), js_constants, js_types);
  add("tsx", {"tsx"}, tree_sitter_tsx(), js_constants, js_types);
  add("shell", {"sh", "bash", "zsh"}, tree_sitter_bash(), {}, {});
  return v;
}

const std::vector<Language>& known_languages() {
  static const std::vector<Language> langs = build_languages();
  return langs;
}

const Language& plain_text_language() {
  static const Language plain = [] {
    Language l;
    l.name = "text";
    return l;
  }();
  return plain;
}

const Language& language_for_path(const std::optional<std::filesystem::path>& path) {
  if (!path) return plain_text_language();
  std::string ext = path->extension().string();
  if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const auto& lang : known_languages()) {
    if (std::find(lang.extensions.begin(), lang.extensions.end(), ext) != lang.extensions.end()) return lang;
  }
  return plain_text_language();
}

bool validate_text(std::string_view text, std::string& msg) {
  size_t n = text.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == 0) {
      msg = "NUL byte at offset " + std::to_string(i);
      return false;
    }
    if (c < 0x80) { ++i; continue; }
    size_t len = 0;
    uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) { len = 2; min_cp = 0x80; }
    else if ((c & 0xF0) == 0xE0) { len = 3; min_cp = 0x800; }
    else if ((c & 0xF8) == 0xF0) { len = 4; min_cp = 0x10000; }
    bool ok = len != 0 && i + len <= n;
    uint32_t cp = c & (0x7F >> len);
    for (size_t j = 1; ok && j < len; ++j) {
      unsigned char b = static_cast<unsigned char>(text[i + j]);
      if ((b & 0xC0) != 0x80) ok = false;
      cp = (cp << 6) | (b & 0x3F);
    }
    if (ok && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) ok = false;
    if (!ok) {
      msg = "malformed UTF-8 at offset " + std::to_string(i);
      return false;
    }
    i += len;
  }
  return true;
}

struct ParserDeleter {
  void operator()(TSParser* p) const { ts_parser_delete(p); }
};

/* some named node of nonzero width lies outside every ERROR subtree */
static bool has_recovered_structure(TSNode root) {
  TSTreeCursor cur = ts_tree_cursor_new(root);
  bool found = false;
  while (true) {
    TSNode node = ts_tree_cursor_current_node(&cur);
    bool skip = ts_node_is_error(node) || ts_node_is_missing(node);
    if (!skip && ts_node_is_named(node) && !ts_node_eq(node, root) &&
        ts_node_end_byte(node) > ts_node_start_byte(node)) {
      found = true;
      break;
    }
    if (!skip && ts_tree_cursor_goto_first_child(&cur)) continue;
    bool moved = false;
    while (!(moved = ts_tree_cursor_goto_next_sibling(&cur))) {
      if (!ts_tree_cursor_goto_parent(&cur)) break;
    }
    if (!moved) break;
  }
  ts_tree_cursor_delete(&cur);
  return found;
}

bool parse_syntax(std::string_view text, const Language& lang, SyntaxTree& tree, std::string& msg) {
  if (!validate_text(text, msg)) return false;
  tree.tree.reset();
  tree.length = text.size();
  tree.has_error = false;
  if (!lang.grammar) return true;
  if (text.size() > std::numeric_limits<uint32_t>::max()) {
    msg = "document too large to parse (" + std::to_string(text.size()) + " bytes)";
    return false;
  }
  std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
  if (!ts_parser_set_language(parser.get(), lang.grammar)) {
    msg = lang.name + " grammar ABI " + std::to_string(ts_language_version(lang.grammar)) +
          " is not supported by this tree-sitter";
    LOG(ERROR) << msg;
    return false;
  }
  std::unique_ptr<TSTree, TreeDeleter> parsed(
      ts_parser_parse_string(parser.get(), nullptr, text.data(), static_cast<uint32_t>(text.size())));
  if (!parsed) {
    msg = lang.name + " parser returned no tree";
    return false;
  }
  TSNode root = ts_tree_root_node(parsed.get());
  if (ts_node_has_error(root)) {
    if (ts_node_is_error(root) || !has_recovered_structure(root)) {
      msg = "no recoverable " + lang.name + " syntax";
      return false;
    }
    VLOG(2) << lang.name << " parse recovered from syntax errors";
    tree.has_error = true;
  }
  tree.tree = std::move(parsed);
  return true;
}

/* node types highlighted as a whole, without looking at their children */
static bool atomic_category(std::string_view type, HighlightCategory& cat) {
  static const std::unordered_map<std::string_view, HighlightCategory> table = {
      {"comment", HighlightCategory::Comment},
      {"line_comment", HighlightCategory::Comment},
      {"block_comment", HighlightCategory::Comment},
      {"string_literal", HighlightCategory::String},
      {"raw_string_literal", HighlightCategory::String},
      {"char_literal", HighlightCategory::String},
      {"concatenated_string", HighlightCategory::String},
      {"string", HighlightCategory::String},
      {"raw_string", HighlightCategory::String},
      {"ansi_c_string", HighlightCategory::String},
      {"template_string", HighlightCategory::String},
      {"interpreted_string_literal", HighlightCategory::String},
      {"rune_literal", HighlightCategory::String},
      {"system_lib_string", HighlightCategory::String},
      {"heredoc_body", HighlightCategory::String},
      {"regex", HighlightCategory::String},
      {"number_literal", HighlightCategory::Number},
      {"integer_literal", HighlightCategory::Number},
      {"float_literal", HighlightCategory::Number},
      {"int_literal", HighlightCategory::Number},
      {"imaginary_literal", HighlightCategory::Number},
      {"number", HighlightCategory::Number},
      {"primitive_type", HighlightCategory::Type},
      {"type_identifier", HighlightCategory::Type},
      {"sized_type_specifier", HighlightCategory::Type},
      {"predefined_type", HighlightCategory::Type},
      {"auto", HighlightCategory::Type},
      {"preproc_arg", HighlightCategory::Preprocessor},
      {"preproc_directive", HighlightCategory::Preprocessor},
  };
  auto it = table.find(type);
  if (it == table.end()) return false;
  cat = it->second;
  return true;
}

namespace {
/* an ancestor of the node being visited, and the field it sits in */
struct Frame {
  std::string_view type;
  std::string_view field;
};
}

static bool in(std::string_view s, std::initializer_list<std::string_view> set) {
  return std::find(set.begin(), set.end(), s) != set.end();
}

static bool is_function_name(std::string_view field, const std::vector<Frame>& path) {
  if (path.empty()) return false;
  const Frame& parent = path.back();
  if (parent.type == "command_name") return true;
  if (field == "function" && parent.type == "call_expression") return true;
  if (field == "macro" && parent.type == "macro_invocation") return true;
  if (field == "declarator" && parent.type == "function_declarator") return true;
  if (field == "name" && in(parent.type, {"function_item", "function_signature_item", "function_declaration",
                                          "generator_function_declaration", "method_declaration",
                                          "method_definition", "function_definition"}))
    return true;
  // obj.f(), a::f(), pkg.F(): the last name of a callee path
  if (in(field, {"field", "property", "name"}) && parent.field == "function" && path.size() >= 2 &&
      path[path.size() - 2].type == "call_expression")
    return true;
  return false;
}

static HighlightCategory leaf_category(TSNode node, std::string_view type, std::string_view field,
                                       std::string_view text, const std::vector<Frame>& path, const Language& lang) {
  static constexpr std::string_view punct = "(){}[];,.";
  static constexpr std::string_view ops = "+-*/%=<>!&|^~?:";
  if (!type.empty() && type[0] == '#') return HighlightCategory::Preprocessor;
  std::string key(type);
  if (lang.constants.count(key)) return HighlightCategory::Constant;
  if (!ts_node_is_named(node)) {
    if (std::all_of(type.begin(), type.end(), [](unsigned char c) { return std::isalpha(c) || c == '_'; }))
      return HighlightCategory::Keyword;
    if (type.find_first_not_of(punct) == std::string_view::npos) return HighlightCategory::Punctuation;
    if (type.find_first_not_of(ops) == std::string_view::npos) return HighlightCategory::Operator;
    return HighlightCategory::Text;
  }
  if (is_function_name(field, path)) return HighlightCategory::Function;
  if (in(type, {"this", "self", "super", "crate", "mutable_specifier"})) return HighlightCategory::Keyword;
  std::string word(text);
  if (lang.constants.count(word)) return HighlightCategory::Constant;
  if (lang.types.count(word)) return HighlightCategory::Type;
  return HighlightCategory::Text;
}

std::vector<HighlightSpan> assign_categories(std::string_view text, const Language& lang, const SyntaxTree& tree) {
  std::vector<HighlightSpan> spans;
  size_t length = std::min(tree.length, text.size());
  size_t pos = 0;
  // clamps overlaps, fills gaps with Text and merges equal neighbours
  auto emit = [&](size_t st, size_t en, HighlightCategory cat) {
    st = std::max(st, pos);
    en = std::min(en, length);
    if (st >= en) return;
    if (st > pos) {
      if (!spans.empty() && spans.back().category == HighlightCategory::Text) spans.back().end = st;
      else spans.push_back({pos, st, HighlightCategory::Text});
    }
    if (!spans.empty() && spans.back().category == cat && spans.back().end == st) spans.back().end = en;
    else spans.push_back({st, en, cat});
    pos = en;
  };

  if (lang.grammar && tree.tree) {
    TSTreeCursor cur = ts_tree_cursor_new(ts_tree_root_node(tree.tree.get()));
    std::vector<Frame> path;
    while (true) {
      TSNode node = ts_tree_cursor_current_node(&cur);
      const char* f = ts_tree_cursor_current_field_name(&cur);
      std::string_view field = f ? f : "";
      std::string_view type = ts_node_type(node);
      size_t st = ts_node_start_byte(node);
      size_t en = ts_node_end_byte(node);
      bool descend = false;
      HighlightCategory cat = HighlightCategory::Text;
      if (en > st && !ts_node_is_missing(node)) {
        if (atomic_category(type, cat)) emit(st, en, cat);
        else if (ts_node_child_count(node) == 0)
          emit(st, en, leaf_category(node, type, field, text.substr(st, en - st), path, lang));
        else descend = true;
      }
      if (descend && ts_tree_cursor_goto_first_child(&cur)) {
        path.push_back({type, field});
        continue;
      }
      bool moved = false;
      while (!(moved = ts_tree_cursor_goto_next_sibling(&cur))) {
        if (!ts_tree_cursor_goto_parent(&cur)) break;
        path.pop_back();
      }
      if (!moved) break;
    }
    ts_tree_cursor_delete(&cur);
  }
  if (pos < length) emit(pos, length, HighlightCategory::Text);
  return spans;
}

#include "highlighter.hpp"
#include "syntax.hpp"
#include <cassert>
#include <chrono>
#include <string>
#include <glog/logging.h>

using namespace std::chrono_literals;

static HighlightCategory category_at(const std::vector<HighlightSpan>& spans, size_t off) {
  for (const auto& s : spans) {
    if (s.start <= off && off < s.end) return s.category;
  }
  assert(false && "offset not covered");
  return HighlightCategory::Text;
}

static void assert_covers(const std::vector<HighlightSpan>& spans, size_t length) {
  size_t pos = 0;
  for (const auto& s : spans) {
    assert(s.start == pos);
    assert(s.end > s.start);
    pos = s.end;
  }
  assert(pos == length);
}

static std::vector<HighlightSpan> highlight(const std::string& text, const Language& lang) {
  SyntaxTree tree;
  std::string msg;
  assert(parse_syntax(text, lang, tree, msg));
  auto spans = assign_categories(text, lang, tree);
  assert_covers(spans, text.size());
  return spans;
}

static void test_cpp_categories() {
  const Language& cpp = language_for_path(std::filesystem::path("a.cpp"));
  assert(cpp.name == "cpp");
  std::string text = "int main() { return 0; } // hi\n#include <x>\nauto s = \"str\";";
  auto spans = highlight(text, cpp);
  assert(category_at(spans, text.find("int")) == HighlightCategory::Type);
  assert(category_at(spans, text.find("main")) == HighlightCategory::Function);
  assert(category_at(spans, text.find("return")) == HighlightCategory::Keyword);
  assert(category_at(spans, text.find('0')) == HighlightCategory::Number);
  assert(category_at(spans, text.find("// hi")) == HighlightCategory::Comment);
  assert(category_at(spans, text.find("#include")) == HighlightCategory::Preprocessor);
  assert(category_at(spans, text.find("\"str\"") + 2) == HighlightCategory::String);
  assert(category_at(spans, text.find('{')) == HighlightCategory::Punctuation);
  assert(category_at(spans, text.find('=')) == HighlightCategory::Operator);
}

static void test_other_languages() {
  const Language& rs = language_for_path(std::filesystem::path("lib.rs"));
  assert(rs.name == "rust");
  std::string text = "fn f<'a>(x: &'a str) -> char { let c = 'z'; println!(\"{}\", c); c }";
  auto spans = highlight(text, rs);
  assert(category_at(spans, 0) == HighlightCategory::Keyword);
  assert(category_at(spans, text.find("str")) == HighlightCategory::Type);
  assert(category_at(spans, text.find("'z'")) == HighlightCategory::String);
  assert(category_at(spans, text.find("println")) == HighlightCategory::Function);

  const Language& sh = language_for_path(std::filesystem::path("run.sh"));
  std::string script = "if true; then\n  echo hi # note\nfi";
  auto sspans = highlight(script, sh);
  assert(category_at(sspans, 0) == HighlightCategory::Keyword);
  assert(category_at(sspans, script.find("# note")) == HighlightCategory::Comment);

  const Language& plain = language_for_path(std::nullopt);
  assert(plain.name == "text");
  auto pspans = highlight("if (x) return 1;", plain);
  assert(pspans.size() == 1);
  assert(pspans[0].category == HighlightCategory::Text);

  assert(language_for_path(std::filesystem::path("App.TSX")).name == "tsx");
  assert(language_for_path(std::filesystem::path("app.js")).name == "javascript");
  assert(language_for_path(std::filesystem::path("app.ts")).name == "typescript");
  assert(language_for_path(std::filesystem::path("main.go")).name == "go");
  assert(language_for_path(std::filesystem::path("notes.md")).name == "text");
  assert(highlight("", plain).empty());
}

static HighlightSpan span_at(const std::vector<HighlightSpan>& spans, size_t off) {
  for (const auto& s : spans) {
    if (s.start <= off && off < s.end) return s;
  }
  assert(false && "offset not covered");
  return {};
}

static void test_grammar_constructs() {
  const Language& cpp = language_for_path(std::filesystem::path("a.cc"));
  // a quote inside a raw string does not end it
  std::string text = "auto s = R\"(a\"b)\"; int x;";
  auto spans = highlight(text, cpp);
  HighlightSpan raw = span_at(spans, text.find('R'));
  assert(raw.category == HighlightCategory::String);
  assert(raw.start == text.find('R'));
  assert(raw.end == text.find(';'));
  assert(category_at(spans, text.find("int")) == HighlightCategory::Type);
  assert(category_at(spans, text.find(';')) == HighlightCategory::Punctuation);

  std::string calls = "void f() { g(nullptr); obj.run(); }";
  auto cspans = highlight(calls, cpp);
  assert(category_at(cspans, calls.find("g(")) == HighlightCategory::Function);
  assert(category_at(cspans, calls.find("nullptr")) == HighlightCategory::Constant);
  assert(category_at(cspans, calls.find("run")) == HighlightCategory::Function);
  assert(category_at(cspans, calls.find("obj")) == HighlightCategory::Text);

  // an unfinished document still highlights what did parse
  std::string partial = "int main() {";
  SyntaxTree tree;
  std::string msg;
  assert(parse_syntax(partial, cpp, tree, msg));
  assert(tree.has_error);
  auto pspans = assign_categories(partial, cpp, tree);
  assert_covers(pspans, partial.size());
  assert(category_at(pspans, 0) == HighlightCategory::Type);
  assert(category_at(pspans, partial.find("main")) == HighlightCategory::Function);

  // nothing outside ERROR nodes
  SyntaxTree broken;
  msg.clear();
  assert(!parse_syntax(")))", cpp, broken, msg));
  assert(!msg.empty());
  assert(!broken.tree);

  const Language& go = language_for_path(std::filesystem::path("main.go"));
  std::string gosrc = "package main\n\nfunc main() {\n\tx := `raw\nline`\n\t_ = nil\n}\n";
  auto gspans = highlight(gosrc, go);
  assert(category_at(gspans, 0) == HighlightCategory::Keyword);
  assert(category_at(gspans, gosrc.find("func")) == HighlightCategory::Keyword);
  assert(category_at(gspans, gosrc.find("main()")) == HighlightCategory::Function);
  assert(category_at(gspans, gosrc.find("line")) == HighlightCategory::String);
  assert(category_at(gspans, gosrc.find("nil")) == HighlightCategory::Constant);
  assert(category_at(gspans, gosrc.find(":=")) == HighlightCategory::Operator);
}

static void test_validation() {
  std::string msg;
  assert(validate_text("plain ascii", msg));
  assert(validate_text("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80", msg));
  assert(!validate_text(std::string("a\0b", 3), msg));
  assert(!validate_text("bad \xff byte", msg));
  assert(!validate_text("truncated \xe2\x82", msg));
  assert(!validate_text("overlong \xc0\xaf", msg));
  assert(!validate_text("surrogate \xed\xa0\x80", msg));
}

static void test_async_pipeline() {
  Highlighter h;
  h.set_language(language_for_path(std::filesystem::path("x.c")));
  std::string good = "int x = 1;";
  h.submit(good, 1);
  assert(h.wait_for(1, 5s));
  auto r1 = h.current();
  assert(r1->version == 1);
  assert(r1->length == good.size());
  assert_covers(r1->spans, good.size());
  assert(h.status().error == EditError::None);

  // a failed parse keeps the previous result and reports the failure
  h.submit("int \xff;", 2);
  assert(h.wait_for(2, 5s));
  assert(h.current()->version == 1);
  assert(h.current() == r1);
  HighlightStatus st = h.status();
  assert(st.error == EditError::ParseFailure);
  assert(st.version == 2);
  assert(!st.message.empty());

  h.submit("int y;", 3);
  assert(h.wait_for(3, 5s));
  assert(h.current()->version == 3);
  assert(h.status().error == EditError::None);
}

static void test_last_write_wins() {
  Highlighter h;
  h.set_language(language_for_path(std::filesystem::path("x.cpp")));
  std::string text;
  for (uint64_t v = 1; v <= 200; ++v) {
    text += "int v" + std::to_string(v) + " = " + std::to_string(v) + ";\n";
    h.submit(text, v);
  }
  assert(h.wait_for(200, 10s));
  auto r = h.current();
  assert(r->version == 200);
  assert(r->length == text.size());
  assert_covers(r->spans, text.size());
  assert(h.parses_run() <= 200);

  // an older snapshot never replaces a newer one
  h.submit("int old;", 5);
  assert(h.wait_for(200, 1s));
  assert(h.current()->version == 200);
  assert(h.processed_version() == 200);
}

int main(int, char** argv) {
  google::InitGoogleLogging(argv[0]);
  test_cpp_categories();
  test_other_languages();
  test_grammar_constructs();
  test_validation();
  test_async_pipeline();
  test_last_write_wins();
  return 0;
}

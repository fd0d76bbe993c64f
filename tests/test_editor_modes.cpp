#include "editor.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <glog/logging.h>

using namespace std::chrono_literals;

static std::filesystem::path temp_dir() {
  auto dir = std::filesystem::temp_directory_path() / "glyph_test_editor_modes";
  std::filesystem::create_directories(dir);
  return dir;
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

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void test_insert_escape_undo() {
  Editor ed;
  assert(ed.mode() == Mode::Normal);
  assert(ed.feed("i") == KeyResult::Applied);
  assert(ed.mode() == Mode::Insert);
  ed.feed("hi");
  assert(ed.buffer().text() == "hi");
  assert(ed.feed("<Esc>") == KeyResult::Applied);
  assert(ed.mode() == Mode::Normal);
  assert(ed.cursors().active().pos == (Position{0, 1}));
  assert(ed.modified());

  assert(ed.feed("u") == KeyResult::Applied);
  assert(ed.buffer().text() == "");
  assert(ed.cursors().active().pos == (Position{0, 0}));
  assert(ed.feed("u") == KeyResult::Rejected);
  assert(ed.message() == "Already at oldest change");
  assert(ed.buffer().text() == "");

  assert(ed.feed("<C-r>") == KeyResult::Applied);
  assert(ed.buffer().text() == "hi");
  assert(ed.feed("<C-r>") == KeyResult::Rejected);
}

static void test_key_results() {
  Editor ed;
  ed.feed("iabc<Esc>");
  assert(ed.feed("Z") == KeyResult::Ignored);
  assert(ed.feed("<C-x>") == KeyResult::Ignored);
  assert(ed.feed("d") == KeyResult::Pending);
  assert(ed.feed("<Esc>") == KeyResult::Applied);
  assert(ed.feed("3") == KeyResult::Pending);
  assert(ed.feed("<Esc>") == KeyResult::Applied);
  assert(ed.feed("<Esc>") == KeyResult::Ignored);
  assert(ed.buffer().text() == "abc");
  assert(ed.mode() == Mode::Normal);
}

static void test_motions_and_operators() {
  Editor ed;
  ed.feed("ihello world<Esc>0dw");
  assert(ed.buffer().text() == "world");
  assert(!ed.reg().linewise);
  assert(ed.reg().joined() == "hello ");
  ed.feed("u");
  assert(ed.buffer().text() == "hello world");

  ed.feed("03x");
  assert(ed.buffer().text() == "lo world");
  ed.feed("$P");
  assert(ed.buffer().text() == "lo worlheld");

  Editor fx;
  fx.feed("ia,b,c<Esc>0f,x");
  assert(fx.buffer().text() == "ab,c");
  fx.feed("0df,");
  assert(fx.buffer().text() == "c");

  Editor cw;
  cw.feed("ifoo bar<Esc>0cwbaz<Esc>");
  assert(cw.buffer().text() == "baz bar");
  cw.feed("u");
  assert(cw.buffer().text() == "foo bar");

  Editor dl;
  dl.feed("ione two<Esc>0D");
  assert(dl.buffer().text() == "");
  dl.feed("p");
  assert(dl.buffer().text() == "one two");
}

static void test_linewise() {
  Editor ed;
  ed.feed("ione<CR>two<CR>three<Esc>");
  assert(ed.buffer().line_count() == 3);
  ed.feed("ggdd");
  assert(ed.buffer().text() == "two\nthree");
  assert(ed.reg().linewise);
  ed.feed("p");
  assert(ed.buffer().text() == "two\none\nthree");
  assert(ed.cursors().active().pos == (Position{1, 0}));
  ed.feed("Gyyggp");
  assert(ed.buffer().text() == "two\nthree\none\nthree");
  ed.feed("2Gdj");
  assert(ed.buffer().text() == "two\nthree");
  ed.feed("Gdd");
  assert(ed.buffer().text() == "two");
  ed.feed("dd");
  assert(ed.buffer().text() == "");
  assert(ed.buffer().line_count() == 1);
}

static void test_open_lines() {
  Editor ed;
  ed.feed("iabc<Esc>oxyz<Esc>");
  assert(ed.buffer().text() == "abc\nxyz");
  ed.feed("Onew<Esc>");
  assert(ed.buffer().text() == "abc\nnew\nxyz");
  ed.feed("u");
  assert(ed.buffer().text() == "abc\nxyz");
  ed.feed("u");
  assert(ed.buffer().text() == "abc");
}

static void test_insert_editing() {
  Editor ed;
  ed.feed("iab<CR>cd<BS><BS><BS>");
  assert(ed.buffer().text() == "ab");
  ed.feed("<Left><Del>");
  assert(ed.buffer().text() == "a");
  ed.feed("<Esc>:set tabwidth=4 expandtab<CR>");
  assert(ed.options().tab_width == 4);
  ed.feed("0i<Tab><Esc>");
  assert(ed.buffer().text() == "    a");
  ed.feed(":set autoindent<CR>A<CR>b<Esc>");
  assert(ed.buffer().text() == "    a\n    b");
}

static void test_visual() {
  Editor ed;
  ed.feed("ihello world<Esc>0vll");
  assert(ed.mode() == Mode::Visual);
  auto lines = ed.visible_lines(0, 5);
  assert(lines.size() == 1);
  assert(lines[0].selections.size() == 1);
  assert(lines[0].selections[0] == std::make_pair(0, 3));
  ed.feed("d");
  assert(ed.mode() == Mode::Normal);
  assert(ed.buffer().text() == "lo world");
  assert(ed.reg().joined() == "hel");

  ed.feed("vey");
  assert(ed.mode() == Mode::Normal);
  assert(ed.reg().joined() == "lo");
  ed.feed("vec");
  assert(ed.mode() == Mode::Insert);
  ed.feed("X<Esc>");
  assert(ed.buffer().text() == "X world");
  ed.feed("v<Esc>");
  assert(ed.mode() == Mode::Normal);
  assert(!ed.cursors().active().anchor);
}

static void test_commands() {
  auto dir = temp_dir();
  auto path = dir / "note.txt";
  std::filesystem::remove(path);

  Editor ed;
  assert(ed.open(path));
  assert(ed.file_path() == path);
  ed.feed("ihi<Esc>");
  assert(ed.feed(":q<CR>") == KeyResult::Rejected);
  assert(!ed.should_quit());
  assert(ed.feed(":w<CR>") == KeyResult::Applied);
  assert(slurp(path) == "hi");
  assert(!ed.modified());
  assert(ed.feed(":nonsense<CR>") == KeyResult::Rejected);
  assert(ed.message().rfind("Not an editor command", 0) == 0);
  assert(ed.feed(":set bogus<CR>") == KeyResult::Rejected);
  assert(ed.feed(":q<CR>") == KeyResult::Applied);
  assert(ed.should_quit());

  Editor other;
  other.feed("ione<CR>two<CR>three<Esc>");
  assert(other.feed(":w<CR>") == KeyResult::Rejected);
  assert(other.message() == "No file name");
  other.feed(":2<CR>");
  assert(other.cursors().active().pos.row == 1);
  other.feed(":99<CR>");
  assert(other.cursors().active().pos.row == 2);
  assert(other.feed(":e " + path.string() + "<CR>") == KeyResult::Rejected);
  assert(other.feed(":e! " + path.string() + "<CR>") == KeyResult::Applied);
  assert(other.buffer().text() == "hi");
  assert(!other.history().can_undo());
  assert(other.feed(":wq<CR>") == KeyResult::Applied);
  assert(other.should_quit());

  // backspace on an empty command line leaves Command mode
  Editor cmd;
  cmd.feed(":x<BS>");
  assert(cmd.mode() == Mode::Command);
  assert(cmd.cmdline().empty());
  cmd.feed("<BS>");
  assert(cmd.mode() == Mode::Normal);
  std::filesystem::remove_all(dir);
}

static void test_rc_file() {
  auto dir = temp_dir();
  auto rc = dir / "glyphrc";
  {
    std::ofstream out(rc);
    out << "\" comment\n# another\nset number\n\nset tabwidth=8 noexpandtab\nbogus\n";
  }
  Editor ed;
  ed.load_rc(rc);
  assert(ed.options().show_line_numbers);
  assert(ed.options().tab_width == 8);
  assert(!ed.options().expand_tab);
  ed.feed("i<Tab><Esc>");
  assert(ed.buffer().text() == "\t");
  std::filesystem::remove_all(dir);
}

static void test_visible_lines_highlight() {
  auto dir = temp_dir();
  auto path = dir / "prog.cpp";
  {
    std::ofstream out(path);
    out << "int main() {\n  return 0;\n}\n";
  }
  Editor ed(path);
  assert(ed.buffer().line_count() == 4);
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  auto lines = ed.visible_lines(0, 10);
  assert(lines.size() == 4);
  assert(lines[1].text == "  return 0;");
  assert(lines[1].byte_start == 13);
  assert(lines[0].cursor_cols.size() == 1 && lines[0].cursor_cols[0] == 0);
  assert(!lines[0].spans.empty());
  assert(lines[0].spans.front().start == 0);
  assert(lines[0].spans.front().category == HighlightCategory::Type);
  bool keyword = false;
  for (const auto& sp : lines[1].spans) {
    assert(sp.end <= lines[1].text.size());
    if (sp.category == HighlightCategory::Keyword) keyword = lines[1].text.substr(sp.start, sp.end - sp.start) == "return";
  }
  assert(keyword);
  assert(ed.visible_lines(2, 10).size() == 2);

  // the last published result stays visible while a newer parse is pending
  ed.feed("ix<Esc>");
  assert(!ed.visible_lines(0, 1).empty());
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  auto cur = ed.highlighter().current();
  assert(cur->version == ed.buffer().revision());
  assert(cur->length == ed.buffer().size());
  assert_covers(cur->spans, ed.buffer().size());

  ed.feed("u");
  assert(ed.buffer().text() == "int main() {\n  return 0;\n}\n");
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  cur = ed.highlighter().current();
  assert(cur->length == ed.buffer().size());
  assert_covers(cur->spans, ed.buffer().size());
  assert(ed.visible_lines(0, 1)[0].spans.front().category == HighlightCategory::Type);

  // ex commands edit without a key press and still reach the highlighter
  ed.feed("2x");
  assert(ed.buffer().text() == "t main() {\n  return 0;\n}\n");
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  assert(ed.execute_command("undo"));
  assert(ed.buffer().text() == "int main() {\n  return 0;\n}\n");
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  cur = ed.highlighter().current();
  assert(cur->version == ed.buffer().revision());
  assert(cur->length == ed.buffer().size());
  assert_covers(cur->spans, ed.buffer().size());
  ed.feed("dd");
  assert(ed.execute_command("e! " + path.string()));
  assert(ed.buffer().text() == "int main() {\n  return 0;\n}\n");
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  assert(ed.highlighter().current()->length == ed.buffer().size());
  std::filesystem::remove_all(dir);
}

static void test_huge_count() {
  Input in;
  for (int i = 0; i < 25; ++i) assert(in.consume_digit('9'));
  assert(in.has_count());
  assert(in.take_count() == static_cast<size_t>(std::numeric_limits<int>::max()));

  Editor ed;
  ed.feed("iabc<CR>def<Esc>gg");
  assert(ed.feed("99999999999999999999999x") == KeyResult::Applied);
  assert(ed.buffer().text() == "\ndef");
  assert(ed.feed("99999999999999999999999j") == KeyResult::Applied);
  assert(ed.cursors().active().pos.row == 1);
}

/* keeps every message glog hands to sinks */
class CaptureSink : public google::LogSink {
public:
  void send(google::LogSeverity, const char*, const char*, int, const struct ::tm*, const char* message,
            size_t message_len) override {
    lines.emplace_back(message, message_len);
  }
  std::vector<std::string> lines;
};

static void test_key_log_lines() {
  CaptureSink sink;
  google::AddLogSink(&sink);
  int saved_v = FLAGS_v;
  FLAGS_v = 2;
  Editor ed;
  ed.feed("ia<Esc><Left><BS>");
  FLAGS_v = saved_v;
  google::RemoveLogSink(&sink);

  bool char_line = false;
  bool special_line = false;
  for (const auto& l : sink.lines) {
    assert(l.find('\0') == std::string::npos);
    if (l.find("key 'a' mode=INSERT") != std::string::npos) char_line = true;
    if (l.rfind("key ", 0) == 0 && l.find('\'') == std::string::npos) special_line = true;
  }
  assert(char_line);
  assert(special_line);
}

int main(int, char** argv) {
  google::InitGoogleLogging(argv[0]);
  test_insert_escape_undo();
  test_key_results();
  test_motions_and_operators();
  test_linewise();
  test_open_lines();
  test_insert_editing();
  test_visual();
  test_commands();
  test_rc_file();
  test_visible_lines_highlight();
  test_huge_count();
  test_key_log_lines();
  return 0;
}

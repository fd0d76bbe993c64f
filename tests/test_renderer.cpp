#include "renderer.hpp"
#include "editor.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <glog/logging.h>

using namespace std::chrono_literals;

static bool screen_contains(const HeadlessTerminal& t, const std::string& needle) {
  for (int r = 0; r < t.get_size().rows; ++r) {
    if (t.row_text(r).find(needle) != std::string::npos) return true;
  }
  return false;
}

static void test_welcome_and_status() {
  Editor ed;
  HeadlessTerminal t(24, 80);
  Renderer renderer;
  Viewport vp;
  renderer.render(t, ed, vp);
  assert(screen_contains(t, "GGG"));
  assert(t.row_text(23).rfind("NORMAL", 0) == 0);
  assert(t.refreshes() == 1);

  ed.feed("ione<CR>two<Esc>");
  renderer.render(t, ed, vp);
  assert(!screen_contains(t, "GGG"));
  assert(t.row_text(0) == "one");
  assert(t.row_text(1) == "two");
  assert(t.row_text(23).find("[+]") != std::string::npos);
  assert(t.cursor_row() == 1 && t.cursor_col() == 2);
}

static void test_gutter_and_selection() {
  Editor ed;
  HeadlessTerminal t(24, 80);
  Renderer renderer;
  Viewport vp;
  ed.feed("ione<CR>two<Esc>:set number<CR>");
  renderer.render(t, ed, vp);
  assert(t.row_text(0) == "1 one");
  assert(t.row_text(1) == "2 two");
  assert(t.cursor_row() == 1 && t.cursor_col() == 4);

  ed.feed("0vl");
  renderer.render(t, ed, vp);
  assert(t.attr_at(1, 2) == 'R');
  assert(t.attr_at(1, 3) == 'R');
  assert(t.attr_at(1, 4) == ' ');
  assert(t.row_text(23).rfind("VISUAL", 0) == 0);

  ed.feed(":se");
  renderer.render(t, ed, vp);
  assert(t.row_text(23) == ":se");
  assert(t.cursor_row() == 23 && t.cursor_col() == 3);
}

static void test_scrolling() {
  Editor ed;
  std::string keys = "i";
  for (int i = 0; i < 30; ++i) keys += (i ? "<CR>l" : "l") + std::to_string(i);
  keys += "<Esc>";
  ed.feed(keys);
  assert(ed.buffer().line_count() == 30);

  HeadlessTerminal t(10, 40);
  Renderer renderer;
  Viewport vp;
  renderer.render(t, ed, vp);
  assert(vp.top_line == 21);
  assert(t.row_text(0) == "l21");
  assert(t.row_text(8) == "l29");
  assert(t.cursor_row() == 8);

  ed.feed("gg");
  renderer.render(t, ed, vp);
  assert(vp.top_line == 0);
  assert(t.row_text(0) == "l0");

  Editor wide;
  wide.feed("i" + std::string(60, 'a') + "<Esc>");
  Viewport wvp;
  renderer.render(t, wide, wvp);
  assert(wvp.left_col == 20);
  assert(t.cursor_col() == 39);

  Viewport v;
  Renderer::scroll_to_cursor(v, {0, 50}, 10, 20);
  assert(v.left_col == 31);
  Renderer::scroll_to_cursor(v, {0, 5}, 10, 20);
  assert(v.left_col == 5);
  Renderer::scroll_to_cursor(v, {3, 0}, 0, 0);
  assert(v.left_col == 0);
}

static void test_highlight_colors() {
  auto dir = std::filesystem::temp_directory_path() / "glyph_test_renderer";
  std::filesystem::create_directories(dir);
  auto path = dir / "x.cpp";
  {
    std::ofstream out(path);
    out << "int x; // note\n";
  }
  Editor ed(path);
  assert(ed.highlighter().wait_for(ed.buffer().revision(), 5s));
  HeadlessTerminal t(5, 120);
  Renderer renderer;
  Viewport vp;
  renderer.render(t, ed, vp);
  char type_attr = static_cast<char>('a' + static_cast<int>(HighlightCategory::Type));
  char comment_attr = static_cast<char>('a' + static_cast<int>(HighlightCategory::Comment));
  assert(t.attr_at(0, 0) == type_attr);
  assert(t.attr_at(0, 2) == type_attr);
  assert(t.attr_at(0, 4) == ' ');
  assert(t.attr_at(0, 7) == comment_attr);
  assert(t.row_text(4).find("x.cpp") != std::string::npos);

  ed.feed(":set nocolor<CR>");
  renderer.render(t, ed, vp);
  assert(t.attr_at(0, 0) == ' ');
  std::filesystem::remove_all(dir);
}

static void test_key_loop() {
  Editor ed;
  HeadlessTerminal t(12, 40);
  Renderer renderer;
  Viewport vp;
  t.push_keys("ihello<Esc>:q<CR>:q!<CR>");
  while (!ed.should_quit()) {
    renderer.render(t, ed, vp);
    KeyEvent ev = t.read_key();
    if (ev.key == Key::None) break;
    ed.handle_key(ev);
  }
  assert(ed.should_quit());
  assert(ed.buffer().text() == "hello");
  assert(t.refreshes() > 10);
}

int main(int, char** argv) {
  google::InitGoogleLogging(argv[0]);
  test_welcome_and_status();
  test_gutter_and_selection();
  test_scrolling();
  test_highlight_colors();
  test_key_loop();
  return 0;
}

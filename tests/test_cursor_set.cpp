#include "cursor_set.hpp"
#include "text_buffer.hpp"
#include <cassert>
#include <string>

static Position step(const TextBuffer& b, Position p, Direction d, Unit u) {
  return CursorSet::motion_target(b, p, d, u, false, p.col);
}

static void test_word_motions() {
  TextBuffer b("foo bar\n\nbaz.qux  end");
  Position p{0, 0};
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{0, 4}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{1, 0}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{2, 0}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{2, 3}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{2, 4}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{2, 9}));
  p = step(b, p, Direction::Forward, Unit::Word); assert(p == (Position{2, 11}));

  p = {2, 4};
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{2, 3}));
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{2, 0}));
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{1, 0}));
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{0, 4}));
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{0, 0}));
  p = step(b, p, Direction::Backward, Unit::Word); assert(p == (Position{0, 0}));

  p = {0, 0};
  p = step(b, p, Direction::Forward, Unit::WordEnd); assert(p == (Position{0, 2}));
  p = step(b, p, Direction::Forward, Unit::WordEnd); assert(p == (Position{0, 6}));
  p = step(b, p, Direction::Forward, Unit::WordEnd); assert(p == (Position{2, 2}));
}

static void test_line_motions() {
  TextBuffer b("abcdef\nab\nabcdef");
  CursorSet cs;
  cs.set_position({0, 5});
  cs.move(b, Direction::Forward, Unit::Line, false);
  assert(cs.active().pos == (Position{1, 1}));
  cs.move(b, Direction::Forward, Unit::Line, false);
  assert(cs.active().pos == (Position{2, 5}));
  cs.move(b, Direction::Forward, Unit::Line, false);
  assert(cs.active().pos == (Position{2, 5}));

  cs.set_position({1, 0});
  cs.move(b, Direction::Forward, Unit::LineBoundary, false);
  assert(cs.active().pos == (Position{1, 1}));
  cs.move(b, Direction::Forward, Unit::Line, false);
  assert(cs.active().pos == (Position{2, 5}));
  cs.move(b, Direction::Backward, Unit::LineBoundary, false);
  assert(cs.active().pos == (Position{2, 0}));

  // Insert mode may sit after the last character
  cs.set_position({0, 6});
  cs.move(b, Direction::Forward, Unit::Character, true);
  assert(cs.active().pos == (Position{0, 6}));
  cs.move(b, Direction::Backward, Unit::Character, true);
  assert(cs.active().pos == (Position{0, 5}));

  TextBuffer indented("    x = 1");
  assert(step(indented, {0, 7}, Direction::Forward, Unit::FirstNonBlank) == (Position{0, 4}));
}

static void test_paragraph_and_document() {
  TextBuffer b("a\nb\n\nc\nd\n\n\ne");
  Position p{0, 0};
  p = step(b, p, Direction::Forward, Unit::Paragraph); assert(p == (Position{2, 0}));
  p = step(b, p, Direction::Forward, Unit::Paragraph); assert(p == (Position{5, 0}));
  p = step(b, p, Direction::Forward, Unit::Paragraph); assert(p == (Position{7, 0}));
  p = step(b, p, Direction::Backward, Unit::Paragraph); assert(p == (Position{2, 0}));
  p = step(b, p, Direction::Backward, Unit::Paragraph); assert(p == (Position{0, 0}));
  assert(step(b, {3, 0}, Direction::Forward, Unit::Document) == (Position{7, 0}));
  assert(step(b, {3, 0}, Direction::Backward, Unit::Document) == (Position{0, 0}));
}

static void test_find_in_line() {
  TextBuffer b("a,b,c");
  CursorSet cs;
  assert(cs.find_in_line(b, ',', Direction::Forward));
  assert(cs.active().pos.col == 1);
  assert(cs.find_in_line(b, ',', Direction::Forward));
  assert(cs.active().pos.col == 3);
  assert(!cs.find_in_line(b, ',', Direction::Forward));
  assert(cs.active().pos.col == 3);
  assert(cs.find_in_line(b, 'a', Direction::Backward));
  assert(cs.active().pos.col == 0);
}

static void test_shift_on_mutation() {
  TextBuffer b("hello world\nabc");
  CursorSet cs;
  b.add_observer([&](const EditOp& op) { cs.on_buffer_mutated(op); });
  cs.set_position({0, 5});
  size_t second = cs.add({1, 2});
  cs.active().anchor = Position{0, 1};

  EditOp op;
  assert(b.insert({0, 2}, "XX\nY", op) == EditError::None);
  assert(cs.active().pos == (Position{1, 4}));
  assert(cs.all()[second].pos == (Position{2, 2}));
  assert(*cs.active().anchor == (Position{0, 1}));
  assert(b.line(1)[4] == ' ');

  // the cursor inside a deleted run collapses to its start
  assert(b.erase({{0, 2}, {1, 1}}, op) == EditError::None);
  assert(b.text() == "hello world\nabc");
  assert(cs.active().pos == (Position{0, 5}));
  assert(cs.all()[second].pos == (Position{1, 2}));

  assert(b.erase({{0, 3}, {0, 8}}, op) == EditError::None);
  assert(cs.active().pos == (Position{0, 3}));

  // an insert exactly at a cursor pushes it along
  cs.set_position({1, 0});
  assert(b.insert({1, 0}, "zz", op) == EditError::None);
  assert(cs.active().pos == (Position{1, 2}));
}

static void test_selection_snapshot_clamp() {
  TextBuffer b("abc\nde");
  CursorSet cs;
  cs.set_position({1, 1});
  cs.start_selection();
  cs.set_position({0, 1});
  Range r = cs.active().selection();
  assert(r.start == (Position{0, 1}));
  assert(r.end == (Position{1, 1}));

  CursorSnapshot snap = cs.snapshot();
  cs.clear_selection();
  cs.set_position({0, 0});
  cs.restore(snap);
  assert(cs.snapshot() == snap);

  cs.remove_secondary();
  cs.set_position({5, 9});
  cs.clamp(b, false);
  assert(cs.active().pos == (Position{1, 1}));
  cs.set_position({1, 9});
  cs.clamp(b, true);
  assert(cs.active().pos == (Position{1, 2}));
}

int main() {
  test_word_motions();
  test_line_motions();
  test_paragraph_and_document();
  test_find_in_line();
  test_shift_on_mutation();
  test_selection_snapshot_clamp();
  return 0;
}

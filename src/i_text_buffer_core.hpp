#pragma once
#include <string>
#include <vector>
#include <string_view>
#include <span>
#include <concepts>
#include <cstddef>

/*
 * Line storage contract shared by the backends.
 * Offsets count every line as its bytes plus one newline; the last line has
 * no trailing newline, so a document of N bytes reports total_bytes() == N.
 */
template <typename Derived>
class TextBufferCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init_from_lines(const std::vector<std::string>& lines) { as_derived().do_init_from_lines(lines); }
  int line_count() const { return as_const_derived().do_line_count(); }
  std::string get_line(int r) const { return as_const_derived().do_get_line(r); }
  size_t line_length(int r) const { return as_const_derived().do_line_length(r); }
  /*insert*/
  void insert_line(size_t row, std::string_view s) { as_derived().do_insert_line(row, s); }
  void insert_lines(size_t row, std::span<const std::string> ss) { as_derived().do_insert_lines(row, ss); }
  /*erase*/
  void erase_line(size_t row) { as_derived().do_erase_line(row); }
  void erase_lines(size_t start_row, size_t end_row) { as_derived().do_erase_lines(start_row, end_row); }
  /*replace*/
  void replace_line(size_t row, std::string_view s) { as_derived().do_replace_line(row, s); }
  /*offsets*/
  size_t line_offset(size_t row) const { return as_const_derived().do_line_offset(row); }
  size_t row_at_offset(size_t offset) const { return as_const_derived().do_row_at_offset(offset); }
  size_t total_bytes() const { return as_const_derived().do_total_bytes(); }
  std::string text() const { return as_const_derived().do_text(); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextBufferCoreCRTPConcept = std::derived_from<T, TextBufferCoreCRTP<T>> &&
  requires(T& t, const T& ct, size_t n, std::string_view sv, std::span<const std::string> ss) {
    { ct.do_line_count() } -> std::convertible_to<int>;
    { ct.do_get_line(0) } -> std::convertible_to<std::string>;
    { ct.do_line_length(0) } -> std::convertible_to<size_t>;
    { ct.do_line_offset(n) } -> std::convertible_to<size_t>;
    { ct.do_row_at_offset(n) } -> std::convertible_to<size_t>;
    { ct.do_total_bytes() } -> std::convertible_to<size_t>;
    { ct.do_text() } -> std::convertible_to<std::string>;
    t.do_insert_line(n, sv);
    t.do_insert_lines(n, ss);
    t.do_erase_line(n);
    t.do_erase_lines(n, n);
    t.do_replace_line(n, sv);
  };

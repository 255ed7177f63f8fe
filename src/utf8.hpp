#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: byte/code point boundary queries shared by layout and backends.
 * Note: no validation; malformed bytes count as one code point each.
 */
#include <cstddef>
#include <string>
#include <string_view>

inline bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

// length in bytes of the sequence introduced by lead byte c
inline size_t utf8_seq_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 1;
}

// C0 controls and DEL; hosts never paint these
inline bool is_control_byte(unsigned char c) { return c < 0x20 || c == 0x7F; }

inline std::string strip_control(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) if (!is_control_byte(static_cast<unsigned char>(c))) out.push_back(c);
  return out;
}

inline bool is_char_boundary(std::string_view s, size_t pos) {
  if (pos == 0 || pos >= s.size()) return true;
  return !is_continuation_byte(static_cast<unsigned char>(s[pos]));
}

// largest boundary <= pos
inline size_t floor_char_boundary(std::string_view s, size_t pos) {
  if (pos >= s.size()) return s.size();
  while (pos > 0 && !is_char_boundary(s, pos)) pos--;
  return pos;
}

// smallest boundary >= pos
inline size_t ceil_char_boundary(std::string_view s, size_t pos) {
  if (pos >= s.size()) return s.size();
  while (pos < s.size() && !is_char_boundary(s, pos)) pos++;
  return pos;
}

// byte length of the longest prefix holding at most max_cols code points
inline size_t utf8_prefix_bytes(std::string_view s, int max_cols) {
  size_t i = 0;
  int cols = 0;
  while (i < s.size() && cols < max_cols) {
    size_t n = utf8_seq_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = s.size() - i;
    i += n;
    cols++;
  }
  return i;
}

inline int utf8_columns(std::string_view s) {
  int cols = 0;
  for (unsigned char c : s) if (!is_continuation_byte(c)) cols++;
  return cols;
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <ranges>
#include <type_traits>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

inline char tolower_ascii(char c) {

  if (c >= 'A' && c <= 'Z') {
    return c + ('a' - 'A');
  }
  return c;
}

inline bool ichar_equals(char a, char b) {
  return a == b ||
      tolower_ascii(static_cast<unsigned char>(a)) ==
      tolower_ascii(static_cast<unsigned char>(b));
}

// Case insensitive string comparison
inline bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::ranges::equal(a, b, ichar_equals);
}

// ASCII case folding, locale independent
inline std::string to_lower(std::string_view s) {
  std::string result(s);
  std::ranges::transform(result, result.begin(), tolower_ascii);
  return result;
}

template <typename T>
concept StringLike = std::is_same_v<std::remove_cvref_t<T>, std::string> ||
                     std::is_same_v<std::remove_cvref_t<T>, std::string_view>;

template <StringLike T>
inline T trim(T str) {
  auto start = str.find_first_not_of(" \t\n\r");
  if (start == T::npos)
      return {};
  auto end = str.find_last_not_of(" \t\n\r");
  return str.substr(start, end - start + 1);
}

template <StringLike T>
inline std::vector<T> split_trim(T str, char delim) {

  auto split_view = str | std::views::split(delim);

  std::vector<T> result;
  for (auto&& part : split_view) {
      auto trimmed = trim(T(&*part.begin(), std::ranges::distance(part)));
      if (!trimmed.empty()) {
          result.push_back(trimmed);
      }
  }
  return result;
}

template <StringLike T>
inline std::vector<T> split(T str, char delim) {
    auto split_result = str | std::ranges::views::split(delim);

    std::vector<T> result;
    for (auto&& part : split_result) {
        result.push_back(T(&*part.begin(), std::ranges::distance(part)));
    }

    return result;
}

// Quotes a PostgreSQL identifier, doubling embedded quotes.
inline std::string quote_identifier(std::string_view input) {

  std::string result;
  result.reserve(input.size() + 2);

  result += '"';
  for (char c : input) {
    if (c == '"')
      result += '"';
    result += c;
  }
  result += '"';

  return result;
}

// Replaces every byte which does not belong to a well-formed UTF-8
// sequence with U+FFFD.
inline std::string make_valid_utf8(std::string_view s) {

  std::string result;
  result.reserve(s.size());

  std::size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);

    std::size_t len = 0;
    // allowed range of the second byte, narrower for overlong forms,
    // surrogates and code points above U+10FFFF
    unsigned char lo = 0x80, hi = 0xBF;

    if (c < 0x80) {
      len = 1;
    } else if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c == 0xE0) {
      len = 3; lo = 0xA0;
    } else if (c == 0xED) {
      len = 3; hi = 0x9F;
    } else if (c >= 0xE1 && c <= 0xEF) {
      len = 3;
    } else if (c == 0xF0) {
      len = 4; lo = 0x90;
    } else if (c == 0xF4) {
      len = 4; hi = 0x8F;
    } else if (c >= 0xF1 && c <= 0xF3) {
      len = 4;
    }

    bool valid = len > 0 && i + len <= s.size();
    for (std::size_t k = 1; valid && k < len; ++k) {
      auto b = static_cast<unsigned char>(s[i + k]);
      valid = (k == 1) ? (b >= lo && b <= hi) : (b >= 0x80 && b <= 0xBF);
    }

    if (valid) {
      result.append(s.substr(i, len));
      i += len;
    } else {
      result.append("\xEF\xBF\xBD");
      ++i;
    }
  }

  return result;
}

template <typename T>
inline std::string to_string(const T &items) {
  return fmt::format("{}", fmt::join(items, ","));
}

#endif

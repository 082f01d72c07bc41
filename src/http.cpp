/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/http.hpp"
#include "tilecore/util.hpp"
#include <vector>
#include <fmt/core.h>

#include <iterator> // for distance
#include <cctype>   // for isxdigit
#include <string_view>


namespace {
/**
 * Functions hexToChar and form_urldecode were taken from GNU CGICC by
 * Stephen F. Booth and Sebastien Diaz, which is also released under the
 * GPL.
 */
char hexToChar(char first, char second) {

  int digit = (first >= 'A' ? ((first & 0xDF) - 'A') + 10 : (first - '0'));
  digit *= 16;
  digit += (second >= 'A' ? ((second & 0xDF) - 'A') + 10 : (second - '0'));
  return static_cast<char>(digit);
}

std::string form_urldecode(const std::string &src) {
  std::string result;
  std::string::const_iterator iter;

  for (iter = src.begin(); iter != src.end(); ++iter) {
    switch (*iter) {
    case '+':
      result.append(1, ' ');
      break;
    case '%':
      // Don't assume well-formed input
      if (std::distance(iter, src.end()) > 2 &&
          std::isxdigit(static_cast<unsigned char>(*(iter + 1))) &&
          std::isxdigit(static_cast<unsigned char>(*(iter + 2)))) {
        char c = *++iter;
        result.append(1, hexToChar(c, *++iter));
      }
      // Just pass the % through untouched
      else {
        result.append(1, '%');
      }
      break;

    default:
      result.append(1, *iter);
      break;
    }
  }

  return result;
}
}

namespace http {

exception::exception(int c, std::string m)
    : code_(c), message_(std::move(m)) {}

int exception::code() const { return code_; }

const char *exception::what() const noexcept { return message_.c_str(); }

server_error::server_error(const std::string &message)
    : exception(500, message) {}

bad_request::bad_request(const std::string &message)
    : exception(400, message) {}

not_acceptable::not_acceptable(const std::string &message)
    : exception(406, message) {}

incompatible_encoding::incompatible_encoding(const std::string &format,
                                             const std::string &encoding)
    : exception(500, fmt::format("Tile format {} cannot be served with {} "
                                 "content encoding", format, encoding)) {}

unknown_format::unknown_format(const std::string &message)
    : exception(500, message) {}


std::string urldecode(const std::string &s) { return form_urldecode(s); }

std::vector<std::pair<std::string, std::string>> parse_params(const std::string &p) {
  // Split the query string into components
  std::vector<std::pair<std::string, std::string>> queryKVPairs;
  if (!p.empty()) {
    auto temp = split(std::string_view(p), '&');

    for (const auto &kvPair : temp) {
      if (kvPair.empty())
        continue;

      // values may themselves contain '=', only the first one separates
      auto pos = kvPair.find('=');
      if (pos == std::string_view::npos) {
        queryKVPairs.emplace_back(std::string{kvPair}, std::string());
      } else {
        queryKVPairs.emplace_back(std::string{kvPair.substr(0, pos)},
                                  std::string{kvPair.substr(pos + 1)});
      }
    }
  }
  return queryKVPairs;
}

} // namespace http

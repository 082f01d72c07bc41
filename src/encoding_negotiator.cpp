/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/encoding_negotiator.hpp"
#include "tilecore/codec.hpp"
#include "tilecore/http.hpp"
#include "tilecore/util.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>
#include <string>

#include <fmt/core.h>

namespace tile {

namespace {

// server preference on equal q-values, cheapest to serve first
constexpr encoding PREFERENCE[] = {
  encoding::brotli, encoding::zstd, encoding::gzip, encoding::zlib,
  encoding::uncompressed
};

int preference_rank(encoding e) {
  auto itr = std::ranges::find(PREFERENCE, e);
  return static_cast<int>(std::distance(std::begin(PREFERENCE), itr));
}

double parse_q_value(std::string_view param) {
  double q = 0.0;
  auto [ptr, ec] = std::from_chars(param.data(), param.data() + param.size(), q,
                                   std::chars_format::fixed);
  if (ec != std::errc() || ptr != param.data() + param.size() ||
      !std::isfinite(q) || q < 0.0 || q > 1.0)
    throw http::bad_request(fmt::format("Invalid q-value '{}' in Accept-Encoding header", param));
  return q;
}

} // anonymous namespace

AcceptEncoding::AcceptEncoding(std::string_view header) {

  auto items = split_trim(header, ',');

  // set default if header empty
  if (items.empty()) {
    m_wildcard = 1.0;
    return;
  }

  for (const auto &item : items) {
    auto elems = split_trim(item, ';');
    if (elems.empty())
      continue;

    double quality = 1.0;
    for (std::size_t i = 1; i < elems.size(); ++i) {
      auto param = elems[i];
      if (param.size() >= 2 && ichar_equals(param[0], 'q') && param[1] == '=')
        quality = parse_q_value(trim(param.substr(2)));
    }

    auto name = elems[0];
    if (name == "*") {
      m_wildcard = quality;
    } else if (auto enc = parse_encoding_token(name)) {
      m_quality[*enc] = quality;
    }
  }
}

AcceptEncoding::AcceptEncoding(const std::vector<encoding> &preferred, bool exclude_identity) {
  double quality = 1.0;
  for (auto e : preferred) {
    if (!m_quality.contains(e)) {
      m_quality[e] = quality;
      quality -= 0.001;
    }
  }
  if (exclude_identity)
    m_quality[encoding::uncompressed] = 0.0;
}

bool AcceptEncoding::accepts(encoding e) const {
  auto itr = m_quality.find(e);
  if (itr != m_quality.end())
    return itr->second > 0.0;

  if (m_wildcard)
    return *m_wildcard > 0.0;

  return e == encoding::uncompressed;
}

std::vector<encoding> AcceptEncoding::ranked() const {

  std::vector<std::pair<encoding, double>> acceptable;

  for (auto e : all_encodings) {
    if (!accepts(e))
      continue;

    auto itr = m_quality.find(e);
    if (itr != m_quality.end()) {
      acceptable.emplace_back(e, itr->second);
    } else if (m_wildcard) {
      acceptable.emplace_back(e, *m_wildcard);
    } else {
      acceptable.emplace_back(e, -1.0);   // implicit identity
    }
  }

  std::ranges::sort(acceptable, [](const auto &a, const auto &b) {
    if (a.second != b.second)
      return a.second > b.second;
    return preference_rank(a.first) < preference_rank(b.first);
  });

  std::vector<encoding> result;
  result.reserve(acceptable.size());
  for (const auto &[e, q] : acceptable)
    result.push_back(e);
  return result;
}

content negotiate(content c, const AcceptEncoding &accept) {

  if (c.enc == encoding::uncompressed || accept.accepts(c.enc))
    return c;

  if (!is_recompressible(c.fmt)) {
    if (accept.identity_excluded())
      throw http::not_acceptable(fmt::format(
          "No acceptable content encoding found for {} tile, it can only be "
          "served as {} or uncompressed", to_string(c.fmt), to_string(c.enc)));

    c.data = decompress(c.data, c.enc);
    c.enc = encoding::uncompressed;
    return c;
  }

  for (auto e : accept.ranked()) {
    if (!is_supported(e))
      continue;

    auto plain = decompress(c.data, c.enc);
    c.data = compress(plain, e);
    c.enc = e;
    return c;
  }

  throw http::not_acceptable(fmt::format(
      "No acceptable content encoding found for {} tile", to_string(c.fmt)));
}

} // namespace tile

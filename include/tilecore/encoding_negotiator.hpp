/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef ENCODING_NEGOTIATOR_HPP
#define ENCODING_NEGOTIATOR_HPP

#include "tilecore/tile_format.hpp"

#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace tile {

/**
 * The encodings a client is prepared to receive, parsed from an
 * Accept-Encoding header.
 *
 * Tokens carry optional q-values (";q=0.5", 0 to 1). "*" stands for every
 * encoding not listed explicitly. Identity is acceptable unless it is given
 * q=0, either directly or through "*;q=0". Unknown tokens are ignored. An
 * empty header is treated as "*".
 */
class AcceptEncoding {
public:
  /**
   * @throws http::bad_request on a malformed q-value
   */
  explicit AcceptEncoding(std::string_view header);

  /**
   * Builds the set from encodings listed in order of preference.
   */
  AcceptEncoding(const std::vector<encoding> &preferred, bool exclude_identity);

  [[nodiscard]] bool accepts(encoding e) const;

  [[nodiscard]] bool identity_excluded() const { return !accepts(encoding::uncompressed); }

  /**
   * Acceptable encodings, most preferred first. Equal q-values are ordered
   * br, zstd, gzip, deflate, identity. Implicitly acceptable identity comes
   * last.
   */
  [[nodiscard]] std::vector<encoding> ranked() const;

  [[nodiscard]] bool empty() const { return ranked().empty(); }

private:
  std::map<encoding, double> m_quality;
  std::optional<double> m_wildcard;
};

/**
 * Reconciles the encoding of a tile with what the client accepts.
 *
 * - uncompressed content, or content in an accepted encoding, is returned
 *   unchanged;
 * - formats which must not be recompressed (raster, unknown) are
 *   decompressed, unless the client refuses identity;
 * - MVT and JSON are decompressed and recompressed with the most preferred
 *   acceptable encoding this build can produce.
 *
 * @throws http::not_acceptable when no acceptable encoding can be produced
 * @throws std::runtime_error when the payload does not decompress
 */
content negotiate(content c, const AcceptEncoding &accept);

} // namespace tile

#endif /* ENCODING_NEGOTIATOR_HPP */

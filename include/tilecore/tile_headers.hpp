/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef TILE_HEADERS_HPP
#define TILE_HEADERS_HPP

#include "tilecore/http.hpp"
#include "tilecore/tile_format.hpp"

#include <optional>
#include <string>

namespace tile {

struct headers {
  std::string content_type;
  std::optional<std::string> content_encoding;

  bool operator==(const headers &) const = default;

  // as name / value pairs, Content-Encoding only when present
  http::headers_t to_list() const;
};

/**
 * Checks that the encoding may be used with the format. Raster formats
 * are only valid uncompressed; throws http::incompatible_encoding otherwise.
 */
void validate(format f, encoding e);

/**
 * Content-Type and Content-Encoding for a payload. Throws
 * http::unknown_format for format::unknown. The pairing itself is not
 * checked, call validate() for that.
 */
headers to_headers(format f, encoding e);

} // namespace tile

#endif /* TILE_HEADERS_HPP */

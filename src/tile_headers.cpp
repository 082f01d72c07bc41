/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/tile_headers.hpp"

namespace tile {

http::headers_t headers::to_list() const {
  http::headers_t result;
  result.emplace_back("Content-Type", content_type);
  if (content_encoding)
    result.emplace_back("Content-Encoding", *content_encoding);
  return result;
}

void validate(format f, encoding e) {
  if (e == encoding::uncompressed || is_recompressible(f) || f == format::unknown)
    return;

  throw http::incompatible_encoding(to_string(f), to_string(e));
}

headers to_headers(format f, encoding e) {

  if (f == format::unknown)
    throw http::unknown_format("Cannot determine a Content-Type for a tile of unknown format");

  return headers{mime::to_string(to_mime(f)), content_encoding_token(e)};
}

} // namespace tile

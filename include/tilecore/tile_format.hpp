/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef TILE_FORMAT_HPP
#define TILE_FORMAT_HPP

#include "tilecore/mime_types.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tile {

/**
 * Payload formats a tile source can produce.
 */
enum class format : uint8_t {
  unknown,
  mvt,
  png,
  jpeg,
  webp,
  gif,
  json
};

/**
 * Transfer compression applied on top of the payload.
 */
enum class encoding : uint8_t {
  uncompressed,
  gzip,
  zlib,
  brotli,
  zstd
};

// all encodings, handy for iterating
inline constexpr encoding all_encodings[] = {
  encoding::uncompressed, encoding::gzip, encoding::zlib,
  encoding::brotli, encoding::zstd
};

/**
 * Vector and JSON payloads gain from transfer compression; raster formats
 * are compressed internally and must be served as they are.
 */
constexpr bool is_recompressible(format f) {
  return f == format::mvt || f == format::json;
}

/**
 * Formats with a magic byte sequence that sniffing can recognise.
 */
constexpr bool is_detectable(format f) {
  return f == format::png || f == format::jpeg || f == format::webp ||
         f == format::gif || f == format::json;
}

mime::type to_mime(format f);

// short lower case name, as used in source metadata ("png", "mvt", ...)
std::string to_string(format f);

// name used in log messages ("gzip", "zlib", "none", ...)
std::string to_string(encoding e);

/**
 * Content-Encoding token, or nothing for uncompressed payloads.
 */
std::optional<std::string> content_encoding_token(encoding e);

/**
 * Maps a Content-Encoding / Accept-Encoding token to an encoding.
 * "identity" maps to uncompressed.
 */
std::optional<encoding> parse_encoding_token(std::string_view token);

/**
 * Parses a format name as declared in source metadata. Accepts the short
 * names (pbf, mvt, png, jpg, jpeg, webp, gif, json) case-insensitively, and
 * MIME types.
 */
std::optional<format> parse_format(std::string_view name);

/**
 * A tile payload together with what is known about it.
 */
struct content {
  format fmt = format::unknown;
  encoding enc = encoding::uncompressed;
  std::string data;
};

struct info {
  format fmt = format::unknown;
  encoding enc = encoding::uncompressed;

  bool operator==(const info &) const = default;
};

std::ostream &operator<<(std::ostream &, format);
std::ostream &operator<<(std::ostream &, encoding);
std::ostream &operator<<(std::ostream &, const info &);

} // namespace tile

#endif /* TILE_FORMAT_HPP */

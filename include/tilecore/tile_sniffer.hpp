/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef TILE_SNIFFER_HPP
#define TILE_SNIFFER_HPP

#include "tilecore/tile_format.hpp"

#include <optional>
#include <string_view>

namespace tile {

/**
 * Classifies a tile payload by its magic bytes.
 *
 * Compression magics (gzip, zlib, zstd) are checked first. When one
 * matches, the payload is decompressed and the raster / JSON checks run on
 * the decompressed bytes. If the payload fails to decompress, or the codec
 * is not part of this build, the encoding is reported and the format is
 * unknown.
 *
 * Never throws. Empty or unrecognised input is (unknown, uncompressed).
 * MVT has no magic, so it is never the result of sniffing alone.
 */
info classify(std::string_view data) noexcept;

/**
 * Same as classify(), but an unknown format is replaced with the format
 * the caller expects, e.g. mvt for a vector function source.
 */
info classify(std::string_view data, format fallback) noexcept;

/**
 * Picks the format to serve a source with, given what was detected from
 * its tiles and what its metadata declares. Detection wins on conflict.
 * Returns nothing when neither is known. Differences are logged against
 * the source name.
 */
std::optional<info> reconcile_format(std::string_view source,
                                     std::optional<info> detected,
                                     std::optional<format> declared);

} // namespace tile

#endif /* TILE_SNIFFER_HPP */

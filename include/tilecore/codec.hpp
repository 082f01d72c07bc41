/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef CODEC_HPP
#define CODEC_HPP

#include "tilecore/tile_format.hpp"

#include <string>
#include <string_view>

namespace tile {

/**
 * Whether this build can compress and decompress the given encoding.
 * Uncompressed is always supported.
 */
bool is_supported(encoding e);

/**
 * Compresses a whole buffer. Levels come from global_settings.
 *
 * Throws output_writer::write_error if the compressor fails and
 * http::server_error if the encoding is not supported by this build.
 */
std::string compress(std::string_view data, encoding e);

/**
 * Decompresses a whole buffer. The compressed stream must be complete,
 * truncated or corrupt input throws std::runtime_error. Unsupported
 * encodings throw http::server_error.
 */
std::string decompress(std::string_view data, encoding e);

} // namespace tile

#endif /* CODEC_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/codec.hpp"
#include "tilecore/http.hpp"
#include "tilecore/options.hpp"
#include "tilecore/output_buffer.hpp"
#include "tilecore/output_writer.hpp"

#ifdef HAVE_LIBZ
#include "tilecore/zlib.hpp"
#endif
#if HAVE_BROTLI
#include "tilecore/brotli.hpp"
#endif
#if HAVE_ZSTD
#include "tilecore/zstd.hpp"
#endif

#include <climits>
#include <memory>
#include <stdexcept>

#include <fmt/core.h>

namespace tile {

namespace {

std::unique_ptr<output_buffer> make_compressor(output_buffer &out, encoding e) {
  switch (e) {
#ifdef HAVE_LIBZ
  case encoding::gzip:
    return std::make_unique<zlib_output_buffer>(out, zlib_output_buffer::gzip,
                                                global_settings::get_deflate_level());
  case encoding::zlib:
    return std::make_unique<zlib_output_buffer>(out, zlib_output_buffer::zlib,
                                                global_settings::get_deflate_level());
#endif
#if HAVE_BROTLI
  case encoding::brotli:
    return std::make_unique<brotli_output_buffer>(out, global_settings::get_brotli_quality());
#endif
#if HAVE_ZSTD
  case encoding::zstd:
    return std::make_unique<zstd_output_buffer>(out, global_settings::get_zstd_level());
#endif
  default:
    break;
  }
  throw http::server_error(fmt::format("{} compression is not supported by this server", to_string(e)));
}

} // anonymous namespace

bool is_supported(encoding e) {
  switch (e) {
  case encoding::uncompressed:
    return true;
#ifdef HAVE_LIBZ
  case encoding::gzip:
  case encoding::zlib:
    return true;
#endif
#if HAVE_BROTLI
  case encoding::brotli:
    return true;
#endif
#if HAVE_ZSTD
  case encoding::zstd:
    return true;
#endif
  default:
    break;
  }
  return false;
}

std::string compress(std::string_view data, encoding e) {

  if (e == encoding::uncompressed)
    return std::string(data);

  if (data.size() > INT_MAX)
    throw output_writer::write_error("tile too large to compress");

  string_output_buffer sink;
  auto compressor = make_compressor(sink, e);

  if (compressor->write(data.data(), static_cast<int>(data.size())) < 0)
    throw output_writer::write_error("compression failed");

  if (compressor->close() < 0)
    throw output_writer::write_error("compression failed");

  return sink.release();
}

std::string decompress(std::string_view data, encoding e) {

  switch (e) {
  case encoding::uncompressed:
    return std::string(data);

#ifdef HAVE_LIBZ
  case encoding::gzip: {
    GZipDecompressor decompressor;
    auto result = decompressor.decompress(data);
    if (!decompressor.complete())
      throw std::runtime_error("Zlib decompression failed: truncated stream");
    return result;
  }
  case encoding::zlib: {
    ZLibDecompressor decompressor;
    auto result = decompressor.decompress(data);
    if (!decompressor.complete())
      throw std::runtime_error("Zlib decompression failed: truncated stream");
    return result;
  }
#endif
#if HAVE_BROTLI
  case encoding::brotli:
    return brotli_decompress(data);
#endif
#if HAVE_ZSTD
  case encoding::zstd:
    return zstd_decompress(data);
#endif
  default:
    break;
  }
  throw http::server_error(fmt::format("{} decompression is not supported by this server", to_string(e)));
}

} // namespace tile

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef ZLIB_HPP
#define ZLIB_HPP

#ifndef HAVE_LIBZ
#error This file should not be included when zlib is not available.
#endif

const unsigned int ZLIB_COMPLETE_CHUNK = 16384;

#include <string>
#include <string_view>

#include <zlib.h>
#include "tilecore/output_buffer.hpp"

/**
 * Compresses an output stream.
 */
class zlib_output_buffer : public output_buffer {
public:
  /**
   * Output mode.
   */
  enum mode { zlib, gzip };

  /**
   * Methods.
   */
  zlib_output_buffer(output_buffer& o, mode m, int level = Z_DEFAULT_COMPRESSION);
  ~zlib_output_buffer() override;
  int write(const char *buffer, int len) noexcept override;
  int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  int flush_output() noexcept;

  output_buffer& out;
  // keep track of bytes written because the z_stream struct doesn't seem to
  // update unless its flushed.
  size_t bytes_in = 0;
  z_stream stream{};
  bool finished{false};
  char outbuf[4096];
};

/*******************************************************************************/

// parts adopted from https://github.com/rudi-cilibrasi/zlibcomplete

class ZLibBaseDecompressor {
public:
  ZLibBaseDecompressor(const ZLibBaseDecompressor &) = delete;
  ZLibBaseDecompressor& operator=(const ZLibBaseDecompressor &) = delete;

  /**
  * @brief Decompression function for zlib-wrapped data.
  *
  * Accepts a buffer of any size containing compressed data.  Returns
  * as much uncompressed data as possible.  Call this function over
  * and over with all the compressed data in a stream in order to decompress
  * the entire stream.
  * @param input Any amount of data to decompress.
  * @retval std::string containing the decompressed data.
  */
  std::string decompress(std::string_view input);

  /**
   * True once the end of the compressed stream has been seen. A tile
   * which never reaches the end was truncated.
   */
  bool complete() const { return stream_end; }

  ~ZLibBaseDecompressor();

protected:
  explicit ZLibBaseDecompressor(int windowBits);

private:
  char outbuf[ZLIB_COMPLETE_CHUNK];
  z_stream stream{};
  bool use_decompression{false};
  bool stream_end{false};
};

class ZLibDecompressor : public ZLibBaseDecompressor {
public:
  ZLibDecompressor();
};

class GZipDecompressor : public ZLibBaseDecompressor {
public:
  GZipDecompressor();
};

#endif /* ZLIB_HPP */

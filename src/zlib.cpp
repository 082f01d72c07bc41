/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

#include "tilecore/zlib.hpp"
#include "tilecore/output_writer.hpp"

zlib_output_buffer::zlib_output_buffer(output_buffer& o,
                                       zlib_output_buffer::mode m,
                                       int level)
    : out(o) {
  int windowBits = 15;

  switch (m) {
  case zlib:
    windowBits = 15;
    break;
  case gzip:
    windowBits = 15 + 16;
    break;
  }

  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;

  if (deflateInit2(&stream, level, Z_DEFLATED, windowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw output_writer::write_error("deflateInit2 failed");
  }

  stream.next_in = nullptr;
  stream.avail_in = 0;
  stream.next_out = (Bytef *)outbuf;
  stream.avail_out = sizeof(outbuf);
}

zlib_output_buffer::~zlib_output_buffer() {
  if (!finished)
    deflateEnd(&stream);
}

int zlib_output_buffer::write(const char *buffer, int len) noexcept {

  if (finished || len < 0)
    return -1;

  if (len > 0) {
    int status = 0;

    stream.next_in = (Bytef *)buffer;
    stream.avail_in = len;

    for (status = deflate(&stream, Z_NO_FLUSH);
         status == Z_OK && stream.avail_in > 0;
         status = deflate(&stream, Z_NO_FLUSH)) {
      if (flush_output() < 0)
        return -1;
    }

    if (status != Z_OK) {
      return -1;
    }

    if (stream.avail_out == 0 && flush_output() < 0) {
      return -1;
    }
  }

  bytes_in += len;

  return len;
}

int zlib_output_buffer::close() noexcept {

  if (finished)
    return -1;

  int status = 0;

  for (status = deflate(&stream, Z_FINISH); status == Z_OK;
       status = deflate(&stream, Z_FINISH)) {
    if (flush_output() < 0)
      return -1;
  }

  if (status != Z_STREAM_END)
    return -1;

  int wrote = out.write(outbuf, sizeof(outbuf) - stream.avail_out);

  finished = true;
  if (deflateEnd(&stream) != Z_OK || wrote < 0) {
    return -1;
  }

  return out.close();
}

int zlib_output_buffer::written() const { return bytes_in; }

int zlib_output_buffer::flush_output() noexcept {
  int len = sizeof(outbuf) - stream.avail_out;
  if (out.write(outbuf, len) != len)
    return -1;

  stream.next_out = (Bytef *)outbuf;
  stream.avail_out = sizeof(outbuf);
  return 0;
}

int zlib_output_buffer::flush() noexcept { return flush_output(); }

/*******************************************************************************/

// parts adopted from https://github.com/rudi-cilibrasi/zlibcomplete

ZLibBaseDecompressor::ZLibBaseDecompressor(int windowBits) {

  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;
  stream.avail_in = 0;
  stream.next_in = Z_NULL;
  int retval = inflateInit2(&stream, windowBits);
  if (retval != Z_OK) {
    throw std::bad_alloc();
  }
  use_decompression = true;
}

ZLibBaseDecompressor::~ZLibBaseDecompressor() {
  if (use_decompression)
    inflateEnd(&stream);
}

std::string ZLibBaseDecompressor::decompress(std::string_view input) {

  std::string result;

  if (!use_decompression)
    throw std::runtime_error("Zlib decompression failed");

  for (std::size_t offset = 0; offset < input.length() && !stream_end;
       offset += ZLIB_COMPLETE_CHUNK) {

    unsigned int bytes_left = input.length() - offset;
    unsigned int bytes_wanted = std::min(ZLIB_COMPLETE_CHUNK, bytes_left);

    // zlib does not modify the input, the cast only satisfies its API
    stream.avail_in = bytes_wanted;
    stream.next_in = (Bytef *) const_cast<char *>(input.data() + offset);

    do {
      stream.avail_out = ZLIB_COMPLETE_CHUNK;
      stream.next_out = (Bytef *) outbuf;
      int ret = inflate(&stream, Z_NO_FLUSH);
      switch (ret) {
      case Z_NEED_DICT:
      case Z_DATA_ERROR:
      case Z_MEM_ERROR:
      case Z_STREAM_ERROR:
          inflateEnd(&stream);
          use_decompression = false;
          throw std::runtime_error("Zlib decompression failed");
      case Z_STREAM_END:
          stream_end = true;
          break;
      }

      unsigned int have = ZLIB_COMPLETE_CHUNK - stream.avail_out;
      result.append(outbuf, have);
    } while (stream.avail_out == 0 && !stream_end);
  }
  return result;
}

GZipDecompressor::GZipDecompressor() : ZLibBaseDecompressor(15+16) { }

ZLibDecompressor::ZLibDecompressor() : ZLibBaseDecompressor(15) { }

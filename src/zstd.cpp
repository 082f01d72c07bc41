/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/zstd.hpp"
#include "tilecore/output_writer.hpp"

#include <memory>
#include <stdexcept>

#if HAVE_ZSTD

zstd_output_buffer::zstd_output_buffer(output_buffer& o, int level)
    : buff(ZSTD_CStreamOutSize()), out(o) {

  ctx_ = ZSTD_createCCtx();

  if (ctx_ == nullptr)
    throw output_writer::write_error("ZSTD_createCCtx failed");

  if (ZSTD_isError(ZSTD_CCtx_setParameter(ctx_, ZSTD_c_compressionLevel, level))) {
    ZSTD_freeCCtx(ctx_);
    throw output_writer::write_error("invalid zstd compression level");
  }
}

zstd_output_buffer::~zstd_output_buffer() {
  ZSTD_freeCCtx(ctx_);
}

int zstd_output_buffer::compress(const char *data, size_t data_length,
                                 ZSTD_EndDirective mode) noexcept {

  ZSTD_inBuffer input{data, data_length, 0};

  while (true) {
    ZSTD_outBuffer output{buff.data(), buff.size(), 0};

    size_t remaining = ZSTD_compressStream2(ctx_, &output, &input, mode);
    if (ZSTD_isError(remaining))
      return -1;

    if (output.pos > 0 && out.write(buff.data(), output.pos) < 0)
      return -1;

    // ZSTD_e_continue is done once all input is consumed, the flushing
    // modes once nothing remains buffered inside the context
    if (mode == ZSTD_e_continue ? input.pos == input.size : remaining == 0)
      break;
  }

  bytes_in += data_length;
  return static_cast<int>(data_length);
}

int zstd_output_buffer::write(const char *buffer, int len) noexcept {
  if (finished || len < 0)
    return -1;
  return compress(buffer, len, ZSTD_e_continue);
}

int zstd_output_buffer::written() const { return bytes_in; }

int zstd_output_buffer::flush() noexcept {
  if (finished)
    return 0;
  return compress(nullptr, 0, ZSTD_e_flush) < 0 ? -1 : 0;
}

int zstd_output_buffer::close() noexcept {
  if (!finished) {
    if (compress(nullptr, 0, ZSTD_e_end) < 0)
      return -1;
    finished = true;
  }
  return out.close();
}

std::string zstd_decompress(std::string_view input) {

  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)>
    ctx(ZSTD_createDCtx(), &ZSTD_freeDCtx);

  if (!ctx)
    throw std::bad_alloc();

  std::string result;
  std::vector<char> buff(ZSTD_DStreamOutSize());

  ZSTD_inBuffer in{input.data(), input.size(), 0};
  size_t last = 1;

  while (in.pos < in.size) {
    ZSTD_outBuffer out{buff.data(), buff.size(), 0};
    last = ZSTD_decompressStream(ctx.get(), &out, &in);
    if (ZSTD_isError(last))
      throw std::runtime_error("Zstd decompression failed");
    result.append(buff.data(), out.pos);
  }

  // drain anything still held back for a full output buffer
  while (last != 0) {
    ZSTD_outBuffer out{buff.data(), buff.size(), 0};
    last = ZSTD_decompressStream(ctx.get(), &out, &in);
    if (ZSTD_isError(last))
      throw std::runtime_error("Zstd decompression failed");
    if (out.pos == 0)
      throw std::runtime_error("Zstd decompression failed: truncated frame");
    result.append(buff.data(), out.pos);
  }

  return result;
}

#endif

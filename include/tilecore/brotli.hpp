/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */


#ifndef BROTLI_HPP
#define BROTLI_HPP

#if HAVE_BROTLI

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <brotli/decode.h>
#include <brotli/encode.h>

#include "tilecore/output_buffer.hpp"


/**
 * Compresses an output stream.
 */
class brotli_output_buffer : public output_buffer {
public:

  explicit brotli_output_buffer(output_buffer& o, int quality = 5);
  brotli_output_buffer(const brotli_output_buffer &old) = delete;
  ~brotli_output_buffer() override;
  int write(const char *buffer, int len) noexcept override;
  int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  int compress(const char *data, int data_length, bool last) noexcept;

  BrotliEncoderState *state_ = nullptr;
  std::array<uint8_t, 16384> buff;

  output_buffer& out;
  // keep track of bytes written
  size_t bytes_in = 0;
  bool flushed{false};
};

/**
 * Decompresses a complete brotli stream. Throws std::runtime_error when the
 * data is corrupt or truncated.
 */
std::string brotli_decompress(std::string_view input);

#endif

#endif

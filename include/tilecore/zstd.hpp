/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef ZSTD_HPP
#define ZSTD_HPP

#if HAVE_ZSTD

#include <string>
#include <string_view>
#include <vector>

#include <zstd.h>

#include "tilecore/output_buffer.hpp"

/**
 * Compresses an output stream into a single zstd frame.
 */
class zstd_output_buffer : public output_buffer {
public:

  explicit zstd_output_buffer(output_buffer& o, int level = 3);
  zstd_output_buffer(const zstd_output_buffer &old) = delete;
  ~zstd_output_buffer() override;
  int write(const char *buffer, int len) noexcept override;
  int written() const override;
  int close() noexcept override;
  int flush() noexcept override;

private:
  int compress(const char *data, size_t data_length, ZSTD_EndDirective mode) noexcept;

  ZSTD_CCtx *ctx_ = nullptr;
  std::vector<char> buff;

  output_buffer& out;
  size_t bytes_in = 0;
  bool finished{false};
};

/**
 * Decompresses a complete zstd frame sequence. Throws std::runtime_error
 * when the data is corrupt or truncated.
 */
std::string zstd_decompress(std::string_view input);

#endif

#endif

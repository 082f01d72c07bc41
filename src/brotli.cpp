/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */


#include "tilecore/brotli.hpp"
#include "tilecore/output_writer.hpp"

#include <memory>
#include <stdexcept>

#if HAVE_BROTLI


brotli_output_buffer::brotli_output_buffer(output_buffer& o, int quality)
    : out(o) {

  state_ = BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);

  if (state_ == nullptr)
    throw output_writer::write_error("BrotliEncoderCreateInstance failed");

  BrotliEncoderSetParameter(state_, BROTLI_PARAM_QUALITY, quality);
}

brotli_output_buffer::~brotli_output_buffer() {
  if (state_ != nullptr)
    BrotliEncoderDestroyInstance(state_);
}

int brotli_output_buffer::compress(const char *data, int data_length, bool last) noexcept
{
  auto operation = last ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
  size_t available_in = data_length;
  auto next_in = reinterpret_cast<const uint8_t *>(data);

  while (true) {
    if (last) {
      if (BrotliEncoderIsFinished(state_)) { break; }
    } else {
      if (!available_in) { break; }
    }

    auto available_out = buff.size();
    auto next_out = buff.data();

    if (!BrotliEncoderCompressStream(state_, operation, &available_in, &next_in,
                                     &available_out, &next_out, nullptr)) {
      return -1;
    }

    auto output_bytes = buff.size() - available_out;
    if (output_bytes &&
        out.write(reinterpret_cast<const char *>(buff.data()), output_bytes) < 0) {
      return -1;
    }
  }

  bytes_in += data_length;

  return data_length;
}


int brotli_output_buffer::write(const char *buffer, int len) noexcept {
  if (flushed || len < 0)
    return -1;
  return compress(buffer, len, false);
}

int brotli_output_buffer::close() noexcept {
  if (!flushed && flush() < 0)
    return -1;

  BrotliEncoderDestroyInstance(state_);
  state_ = nullptr;

  return out.close();
}

int brotli_output_buffer::written() const { return bytes_in; }


int brotli_output_buffer::flush() noexcept {

  if (flushed) { // brotli does not support multiple flush operations
    return 0;
  }

  if (compress(nullptr, 0, true) < 0)
    return -1;
  flushed = true;
  return 0;
}

std::string brotli_decompress(std::string_view input) {

  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>
    state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr),
          &BrotliDecoderDestroyInstance);

  if (!state)
    throw std::bad_alloc();

  std::string result;
  std::array<uint8_t, 16384> buff;

  size_t available_in = input.size();
  auto next_in = reinterpret_cast<const uint8_t *>(input.data());

  while (true) {
    auto available_out = buff.size();
    auto next_out = buff.data();

    auto status = BrotliDecoderDecompressStream(state.get(), &available_in, &next_in,
                                                &available_out, &next_out, nullptr);

    result.append(reinterpret_cast<const char *>(buff.data()), buff.size() - available_out);

    if (status == BROTLI_DECODER_RESULT_SUCCESS)
      break;

    if (status == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
      continue;

    // error, or the input ended before the stream did
    throw std::runtime_error("Brotli decompression failed");
  }

  return result;
}

#endif

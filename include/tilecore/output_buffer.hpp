/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef OUTPUT_BUFFER_HPP
#define OUTPUT_BUFFER_HPP

#include <string>
#include <string_view>

/**
 * Implement this interface to provide custom output.
 */
struct output_buffer {
  // most methods here are noexcept, since they're also being called by C-style callbacks
  // that don't support exceptions. A return code of -1 is used instead to signal errors.
  virtual int write(const char *buffer, int len) noexcept = 0;
  virtual int write(std::string_view str) noexcept { return write(str.data(), str.size()); }
  virtual int written() const = 0;
  virtual int close() noexcept = 0;
  virtual int flush() noexcept = 0;
  virtual ~output_buffer() = default;

  output_buffer() = default;

  output_buffer(const output_buffer&) = delete;
  output_buffer& operator=(const output_buffer&) = delete;

  output_buffer(output_buffer&&) = delete;
  output_buffer& operator=(output_buffer&&) = delete;
};

/**
 * Collects everything written into a string. Tile payloads are always
 * fully materialised, so this is the sink the codecs write into.
 */
class string_output_buffer : public output_buffer
{
public:
    using output_buffer::write;
    string_output_buffer() = default;

    int write(const char *buffer, int len) noexcept override;
    int written() const override { return static_cast<int>(m_data.size()); }
    int close() noexcept override { return 0; }
    int flush() noexcept override { return 0; }

    ~string_output_buffer() override = default;

    const std::string& str() const { return m_data; }
    std::string release() { return std::move(m_data); }

private:
    std::string m_data;
};

#endif /* OUTPUT_BUFFER_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include <string>
#include <stdexcept>


/**
 * base class of all writers.
 */
class output_writer {
public:

  output_writer(const output_writer &) = delete;
  output_writer& operator=(const output_writer &) = delete;
  output_writer(output_writer &&) = default;
  output_writer& operator=(output_writer &&) = default;

  output_writer() = default;

  virtual ~output_writer() noexcept = default;

  // flushes the output buffer
  virtual void flush() = 0;

  /**
   * Thrown when writing or compressing fails.
   */
  class write_error : public std::runtime_error {
  public:
    explicit write_error(const char *message);
  };
};

#endif /* OUTPUT_WRITER_HPP */

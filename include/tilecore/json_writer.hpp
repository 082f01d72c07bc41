/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef JSON_WRITER_HPP
#define JSON_WRITER_HPP

#include <string_view>

#include <yajl/yajl_gen.h>

#include "tilecore/output_buffer.hpp"
#include "tilecore/output_writer.hpp"

/**
 * nice(ish) interface to writing a JSON document.
 */
class json_writer : public output_writer {
public:
  json_writer(const json_writer &) = delete;
  json_writer& operator=(const json_writer &) = delete;
  json_writer(json_writer &&) = delete;

  // create a json writer using a callback object for output
  explicit json_writer(output_buffer &out);

  ~json_writer() noexcept override;

  void start_object();
  void object_key(std::string_view sv);
  void end_object();

  void start_array();
  void end_array();

  void entry(bool b);
  void entry(std::string_view s);
  void entry(const char *s) { entry(std::string_view(s)); }
  void entry_null();

  // a number exactly as it was written in the source document
  void entry_number(std::string_view raw);

  // writes anything still buffered to the output
  void flush() override;

private:
  void check(yajl_gen_status status);
  void output_yajl_buffer(bool ignore_buffer_size);

  yajl_gen gen;
  output_buffer& out;

  constexpr static int MAX_BUFFER = 16384;
};

#endif /* JSON_WRITER_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */


#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "tilecore/json_writer.hpp"


json_writer::json_writer(output_buffer &out)
    : out(out) {

  gen = yajl_gen_alloc(nullptr);

  if (gen == nullptr) {
    throw std::runtime_error("error creating json writer.");
  }

  yajl_gen_config(gen, yajl_gen_beautify, 0);
}

json_writer::~json_writer() noexcept {
  // anything not flushed yet belongs to a document which was abandoned
  yajl_gen_free(gen);
}

void json_writer::start_object() {
  check(yajl_gen_map_open(gen));
}

void json_writer::object_key(std::string_view sv) {
  entry(sv);
}

void json_writer::end_object() {
  check(yajl_gen_map_close(gen));
  output_yajl_buffer(false);
}

void json_writer::start_array() {
  check(yajl_gen_array_open(gen));
}

void json_writer::end_array() {
  check(yajl_gen_array_close(gen));
  output_yajl_buffer(false);
}

void json_writer::entry(bool b) {
  check(yajl_gen_bool(gen, b ? 1 : 0));
}

void json_writer::entry(std::string_view s) {
  check(yajl_gen_string(gen, (const unsigned char *)s.data(), s.size()));
}

void json_writer::entry_null() {
  check(yajl_gen_null(gen));
}

void json_writer::entry_number(std::string_view raw) {
  check(yajl_gen_number(gen, raw.data(), raw.size()));
}

void json_writer::flush() {
  output_yajl_buffer(true);
}

void json_writer::check(yajl_gen_status status) {
  if (status != yajl_gen_status_ok)
    throw output_writer::write_error("JSON generation failed");
}

void json_writer::output_yajl_buffer(bool ignore_buffer_size)
{
  const unsigned char *yajl_buf = nullptr;
  size_t yajl_buf_len = 0;

  if (yajl_gen_get_buf(gen, &yajl_buf, &yajl_buf_len) != yajl_gen_status_ok)
    throw output_writer::write_error("Expected yajl_gen_status_ok");

  // Keep adding more JSON elements, if the yajl buffer size hasn't
  // reached our threshold value yet.
  // Setting ignore_buffer_size to true will skip this check.
  if (!ignore_buffer_size && yajl_buf_len < MAX_BUFFER)
    return;

  // empty yajl buffer -> don't send anything to out
  if (yajl_buf_len != 0) {

    // Write yajl buffer to output
    int wrote_len = out.write((const char*) yajl_buf, yajl_buf_len);

    if (wrote_len != int(yajl_buf_len)) {
      throw output_writer::write_error(
          "Output buffer wrote a different amount than was expected.");
    }
  }

  // clear YAJL internal buffer
  yajl_gen_clear(gen);
}

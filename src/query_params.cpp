/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/query_params.hpp"
#include "tilecore/http.hpp"
#include "tilecore/json_writer.hpp"
#include "tilecore/output_buffer.hpp"
#include "tilecore/util.hpp"

#include <exception>
#include <map>
#include <memory>
#include <new>
#include <string_view>

#include <yajl/yajl_parse.h>

namespace {

// yajl_gen refuses to nest deeper than 128 levels, and a value sits
// inside the outer object and possibly an array of repeated values
constexpr int MAX_VALUE_DEPTH = 64;

/**
 * Parser callbacks which copy a JSON value into a json_writer. Without a
 * writer they only check the value: well-formed, no comments, a single
 * value and not nested too deeply.
 */
struct json_copy {
  json_writer *writer = nullptr;
  int depth = 0;
  std::exception_ptr error;

  template <typename Fn>
  static int forward(void *ctx, Fn &&fn) {
    auto *self = static_cast<json_copy *>(ctx);
    if (self->writer == nullptr)
      return 1;
    try {
      fn(*self->writer);
    } catch (const std::exception &) {
      self->error = std::current_exception();
      return 0;
    }
    return 1;
  }

  static int on_null(void *ctx) {
    return forward(ctx, [](json_writer &w) { w.entry_null(); });
  }

  static int on_boolean(void *ctx, int b) {
    return forward(ctx, [b](json_writer &w) { w.entry(b != 0); });
  }

  static int on_number(void *ctx, const char *s, size_t len) {
    return forward(ctx, [=](json_writer &w) { w.entry_number(std::string_view(s, len)); });
  }

  // yajl has already checked the UTF-8 and kept any escaped NUL bytes
  static int on_string(void *ctx, const unsigned char *s, size_t len) {
    return forward(ctx, [=](json_writer &w) {
      w.entry(std::string_view(reinterpret_cast<const char *>(s), len));
    });
  }

  static int on_map_key(void *ctx, const unsigned char *s, size_t len) {
    return forward(ctx, [=](json_writer &w) {
      w.object_key(std::string_view(reinterpret_cast<const char *>(s), len));
    });
  }

  static int on_start_map(void *ctx) {
    if (++static_cast<json_copy *>(ctx)->depth > MAX_VALUE_DEPTH)
      return 0;
    return forward(ctx, [](json_writer &w) { w.start_object(); });
  }

  static int on_end_map(void *ctx) {
    --static_cast<json_copy *>(ctx)->depth;
    return forward(ctx, [](json_writer &w) { w.end_object(); });
  }

  static int on_start_array(void *ctx) {
    if (++static_cast<json_copy *>(ctx)->depth > MAX_VALUE_DEPTH)
      return 0;
    return forward(ctx, [](json_writer &w) { w.start_array(); });
  }

  static int on_end_array(void *ctx) {
    --static_cast<json_copy *>(ctx)->depth;
    return forward(ctx, [](json_writer &w) { w.end_array(); });
  }
};

const yajl_callbacks json_copy_callbacks = {
  json_copy::on_null,
  json_copy::on_boolean,
  nullptr,                  // integers and doubles are passed on
  nullptr,                  // as numbers, digits unchanged
  json_copy::on_number,
  json_copy::on_string,
  json_copy::on_start_map,
  json_copy::on_map_key,
  json_copy::on_end_map,
  json_copy::on_start_array,
  json_copy::on_end_array
};

using yajl_handle_ptr = std::unique_ptr<yajl_handle_t, decltype(&yajl_free)>;

// runs the parser over the whole value, true if it was accepted
bool parse_json(const std::string &raw, json_copy &copy) {

  yajl_handle_ptr handle(yajl_alloc(&json_copy_callbacks, nullptr, &copy), &yajl_free);
  if (!handle)
    throw std::bad_alloc();

  yajl_config(handle.get(), yajl_allow_comments, 0);

  auto status = yajl_parse(handle.get(), reinterpret_cast<const unsigned char *>(raw.data()),
                           raw.size());
  if (status == yajl_status_ok)
    status = yajl_complete_parse(handle.get());

  if (copy.error)
    std::rethrow_exception(copy.error);

  return status == yajl_status_ok;
}

void write_value(json_writer &writer, const std::string &raw) {

  json_copy check;
  if (parse_json(raw, check)) {
    json_copy copy;
    copy.writer = &writer;
    parse_json(raw, copy);
  } else {
    writer.entry(std::string_view(make_valid_utf8(raw)));
  }
}

} // anonymous namespace

std::string encode_query_params(const query_params_t &params) {

  // std::map gives the sorted key order, the vectors keep encounter order
  std::map<std::string, std::vector<std::string>> grouped;
  for (const auto &[key, value] : params) {
    grouped[key].push_back(value);
  }

  string_output_buffer buffer;
  json_writer writer(buffer);

  writer.start_object();
  for (const auto &[key, values] : grouped) {
    writer.object_key(make_valid_utf8(key));

    if (values.size() == 1) {
      write_value(writer, values.front());
    } else {
      writer.start_array();
      for (const auto &value : values)
        write_value(writer, value);
      writer.end_array();
    }
  }
  writer.end_object();
  writer.flush();

  return buffer.release();
}

query_params_t parse_query_string(const std::string &query_string,
                                  const std::set<std::string> &reserved) {

  query_params_t result;

  for (const auto &[key, value] : http::parse_params(query_string)) {
    auto decoded_key = http::urldecode(key);
    if (reserved.contains(decoded_key))
      continue;
    result.emplace_back(std::move(decoded_key), http::urldecode(value));
  }

  return result;
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/codec.hpp"
#include "tilecore/function_resolver.hpp"
#include "tilecore/http.hpp"
#include "tilecore/tile_pipeline.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using tile::AcceptEncoding;
using tile::encoding;

namespace {

const std::string png_tile("\x89\x50\x4E\x47\x0D\x0A\x1A\x0A\x00\x00\x00\x0DIHDR", 16);
const std::string mvt_tile("\x1A\x05\x0A\x03\x66\x6F\x6F\x78\x02\x1A\x05", 11);

class test_tile_query : public tile_query {
public:
  explicit test_tile_query(tile_row r) : row(std::move(r)) {}

  tile_row execute(const call_plan &, int32_t z, int32_t x, int32_t y,
                   const std::string &query_json) override {
    last_z = z;
    last_x = x;
    last_y = y;
    last_query = query_json;
    return row;
  }

  tile_row row;
  int32_t last_z = -1, last_x = -1, last_y = -1;
  std::string last_query;
};

call_plan make_plan(bool with_query) {
  function_signature sig{"public", "tiles",
                         {{"z", "integer"}, {"x", "integer"}, {"y", "integer"}},
                         {"record", {{"mvt", "bytea"}, {"etag", "text"}}}};
  if (with_query)
    sig.arguments.push_back({"query", "json"});
  return bind_call_plan(sig);
}

} // anonymous namespace

TEST_CASE("Render an uncompressed vector tile", "[pipeline]") {
  test_tile_query query(tile_row{mvt_tile, "abc"});

  auto response = render_tile(make_plan(false), query, 3, 4, 5, {{"a", "1"}}, AcceptEncoding("gzip"));

  CHECK(query.last_z == 3);
  CHECK(query.last_x == 4);
  CHECK(query.last_y == 5);
  CHECK(query.last_query.empty());

  CHECK(response.data == mvt_tile);
  CHECK(response.content_type == "application/x-protobuf");
  CHECK(response.content_encoding == std::nullopt);
  CHECK(response.etag == "abc");
}

TEST_CASE("Pass query parameters to functions which take them", "[pipeline]") {
  test_tile_query query(tile_row{mvt_tile, std::nullopt});

  render_tile(make_plan(true), query, 0, 0, 0, {{"b", "x"}, {"a", "1"}}, AcceptEncoding(""));
  CHECK(query.last_query == R"({"a":1,"b":"x"})");

  render_tile(make_plan(true), query, 0, 0, 0, {}, AcceptEncoding(""));
  CHECK(query.last_query == "{}");
}

TEST_CASE("Recompress a vector tile for the client", "[pipeline]") {
  test_tile_query query(tile_row{tile::compress(mvt_tile, encoding::zlib), std::nullopt});

  auto response = render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("gzip"));

  CHECK(response.content_type == "application/x-protobuf");
  CHECK(response.content_encoding == "gzip");
  CHECK(tile::decompress(response.data, encoding::gzip) == mvt_tile);

  http::headers_t expected{{"Content-Type", "application/x-protobuf"},
                           {"Content-Encoding", "gzip"},
                           {"Vary", "Accept-Encoding"}};
  CHECK(response.headers() == expected);
}

TEST_CASE("Serve raster tiles from a vector function", "[pipeline]") {
  test_tile_query query(tile_row{png_tile, std::nullopt});

  auto response = render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("br"));
  CHECK(response.content_type == "image/png");
  CHECK(response.content_encoding == std::nullopt);
}

TEST_CASE("Reject compressed raster tiles", "[pipeline]") {
  test_tile_query query(tile_row{tile::compress(png_tile, encoding::gzip), std::nullopt});

  CHECK_THROWS_AS(render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("gzip")),
                  http::incompatible_encoding);
}

TEST_CASE("Empty tiles", "[pipeline]") {
  test_tile_query query(tile_row{"", "etag"});

  auto response = render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("gzip"));
  CHECK(response.data.empty());
  CHECK(response.content_type == "application/x-protobuf");
  CHECK(response.content_encoding == std::nullopt);

  http::headers_t expected{{"Content-Type", "application/x-protobuf"},
                           {"Vary", "Accept-Encoding"},
                           {"ETag", "\"etag\""}};
  CHECK(response.headers() == expected);
}

TEST_CASE("No acceptable encoding", "[pipeline]") {
  test_tile_query query(tile_row{tile::compress(mvt_tile, encoding::gzip), std::nullopt});

  CHECK_THROWS_AS(render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("*;q=0")),
                  http::not_acceptable);
}

TEST_CASE("Corrupt compressed tiles keep their encoding", "[pipeline]") {
  const std::string corrupt("\x1F\x8B\x08\x00garbage", 11);
  test_tile_query query(tile_row{corrupt, std::nullopt});

  auto response = render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("gzip"));
  CHECK(response.content_type == "application/x-protobuf");
  CHECK(response.content_encoding == "gzip");
  CHECK(response.data == corrupt);

  CHECK_THROWS_AS(render_tile(make_plan(false), query, 1, 1, 1, {}, AcceptEncoding("br")),
                  std::runtime_error);
}

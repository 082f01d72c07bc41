/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

/* -*- coding: utf-8 -*- */
#include "tilecore/http.hpp"

#include <string>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE("http_check_urldecoding", "[http]") {
  CHECK(http::urldecode("%E3%82%A2") == "ア");
  CHECK(http::urldecode("%C3%80") == "À");

  // RFC 3986 - uppercase A-F are equivalent to lowercase a-f
  CHECK(http::urldecode("%e3%82%a2") == "ア");
  CHECK(http::urldecode("%c3%80") == "À");

  CHECK(http::urldecode("a+b") == "a b");
}

TEST_CASE("http_check_urldecoding_truncated_escape", "[http]") {
  CHECK(http::urldecode("abc%") == "abc%");
  CHECK(http::urldecode("abc%4") == "abc%4");
}

TEST_CASE("http_check_urldecoding_non_ascii_after_percent", "[http]") {
  // bytes above 0x7f are not hex digits, the % is kept as is
  CHECK(http::urldecode("%\xC3\x80") == "%\xC3\x80");
  CHECK(http::urldecode("a%\xFF\xFF" "b") == "a%\xFF\xFF" "b");
  CHECK(http::urldecode("%e3%82%a2%\xE3") == "\xE3\x82\xA2%\xE3");
}

TEST_CASE("http_check_parse_params", "[http]") {
  using params_t = std::vector<std::pair<std::string, std::string> >;
  params_t params = http::parse_params("a2=r%20b&a3=2%20q&a3=a&b5=%3D%253D&c%40=&c2=");

  CHECK(params.size() == 6);
  CHECK(params[0].first == "a2");   CHECK(params[0].second == "r%20b");
  CHECK(params[1].first == "a3");   CHECK(params[1].second == "2%20q");
  CHECK(params[2].first == "a3");   CHECK(params[2].second == "a");
  CHECK(params[3].first == "b5");   CHECK(params[3].second == "%3D%253D");
  CHECK(params[4].first == "c%40"); CHECK(params[4].second == "");
  CHECK(params[5].first == "c2");   CHECK(params[5].second == "");
}

TEST_CASE("http_check_parse_params_value_with_equals", "[http]") {
  auto params = http::parse_params("filter=a=b&&x=1");

  REQUIRE(params.size() == 2);
  CHECK(params[0].first == "filter"); CHECK(params[0].second == "a=b");
  CHECK(params[1].first == "x");      CHECK(params[1].second == "1");
}

TEST_CASE("http_check_exceptions", "[http]") {
  CHECK(http::bad_request("x").code() == 400);
  CHECK(http::not_acceptable("x").code() == 406);
  CHECK(http::server_error("x").code() == 500);
  CHECK(http::unknown_format("x").code() == 500);

  http::incompatible_encoding e("png", "gzip");
  CHECK(e.code() == 500);
  CHECK(std::string(e.what()) == "Tile format png cannot be served with gzip content encoding");
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/codec.hpp"
#include "tilecore/encoding_negotiator.hpp"
#include "tilecore/http.hpp"
#include "tilecore/tile_sniffer.hpp"

#include <string>
#include <vector>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using tile::AcceptEncoding;
using tile::encoding;
using tile::format;

namespace {

const std::string png_tile("\x89\x50\x4E\x47\x0D\x0A\x1A\x0A\x00\x00\x00\x0DIHDR", 16);
const std::string mvt_tile("\x1A\x05\x0A\x03\x66\x6F\x6F\x78\x02\x1A\x05", 11);

} // anonymous namespace

TEST_CASE("Accept-Encoding header parsing", "[accept_encoding]") {

  SECTION("test: q-values order encodings") {
    AcceptEncoding accept("deflate, gzip;q=1.0, *;q=0.5");
    CHECK(accept.ranked().front() == encoding::gzip);
    CHECK(accept.accepts(encoding::zlib));
    CHECK(accept.accepts(encoding::brotli));
  }

  SECTION("test: explicit weights") {
    AcceptEncoding accept("gzip;q=0.5, br;q=0.9, identity;q=0.1");
    CHECK(accept.ranked() == std::vector<encoding>{encoding::brotli, encoding::gzip, encoding::uncompressed});
    CHECK_FALSE(accept.accepts(encoding::zstd));
  }

  SECTION("test: server preference on ties") {
    AcceptEncoding accept("gzip, deflate, br, zstd");
    CHECK(accept.ranked() == std::vector<encoding>{encoding::brotli, encoding::zstd, encoding::gzip,
                                                  encoding::zlib, encoding::uncompressed});
  }

  SECTION("test: identity is implicitly acceptable but ranked last") {
    AcceptEncoding accept("gzip;q=0.1");
    CHECK(accept.accepts(encoding::uncompressed));
    CHECK(accept.ranked() == std::vector<encoding>{encoding::gzip, encoding::uncompressed});
  }

  SECTION("test: identity excluded") {
    CHECK(AcceptEncoding("gzip, identity;q=0").identity_excluded());
    CHECK(AcceptEncoding("*;q=0").identity_excluded());
    CHECK(AcceptEncoding("*;q=0").empty());
    CHECK_FALSE(AcceptEncoding("gzip").identity_excluded());
  }

  SECTION("test: empty header accepts anything") {
    AcceptEncoding accept("");
    for (auto e : tile::all_encodings)
      CHECK(accept.accepts(e));
  }

  SECTION("test: unknown codings are ignored") {
    AcceptEncoding accept("compress, x-foo;q=0.8, gzip");
    CHECK(accept.ranked() == std::vector<encoding>{encoding::gzip, encoding::uncompressed});
  }

  SECTION("test: x-gzip alias") {
    CHECK(AcceptEncoding("x-gzip").accepts(encoding::gzip));
  }

  SECTION("test: invalid q-values") {
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=foobar"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q="}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=1.1"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=-0.1"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=NAN"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=INF"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=0x1"}, http::bad_request);
    CHECK_THROWS_AS(AcceptEncoding{"gzip;q=0.5abc"}, http::bad_request);
  }

  SECTION("test: preference list") {
    AcceptEncoding accept(std::vector<encoding>{encoding::zstd, encoding::gzip}, true);
    CHECK(accept.ranked() == std::vector<encoding>{encoding::zstd, encoding::gzip});
    CHECK(accept.identity_excluded());
  }
}

TEST_CASE("Negotiate passes through what the client accepts", "[negotiate]") {

  SECTION("uncompressed content is never touched") {
    auto c = tile::negotiate(tile::content{format::mvt, encoding::uncompressed, mvt_tile},
                             AcceptEncoding("gzip, identity;q=0"));
    CHECK(c.enc == encoding::uncompressed);
    CHECK(c.data == mvt_tile);
  }

  SECTION("accepted encoding is kept byte for byte") {
    auto gz = tile::compress(mvt_tile, encoding::gzip);
    auto c = tile::negotiate(tile::content{format::mvt, encoding::gzip, gz}, AcceptEncoding("gzip"));
    CHECK(c.enc == encoding::gzip);
    CHECK(c.data == gz);
  }
}

TEST_CASE("Negotiate recompresses vector tiles", "[negotiate]") {

  auto zlib = tile::compress(mvt_tile, encoding::zlib);

  SECTION("to gzip") {
    auto c = tile::negotiate(tile::content{format::mvt, encoding::zlib, zlib}, AcceptEncoding("gzip"));
    CHECK(c.fmt == format::mvt);
    CHECK(c.enc == encoding::gzip);
    CHECK(tile::decompress(c.data, encoding::gzip) == mvt_tile);
  }

  SECTION("to identity") {
    auto c = tile::negotiate(tile::content{format::mvt, encoding::zlib, zlib}, AcceptEncoding("identity"));
    CHECK(c.enc == encoding::uncompressed);
    CHECK(c.data == mvt_tile);
  }

  SECTION("nothing acceptable") {
    CHECK_THROWS_AS(tile::negotiate(tile::content{format::mvt, encoding::zlib, zlib},
                                    AcceptEncoding("*;q=0")),
                    http::not_acceptable);
  }
}

TEST_CASE("Negotiate decompresses raster tiles", "[negotiate]") {

  auto gz = tile::compress(png_tile, encoding::gzip);

  SECTION("identity acceptable") {
    auto c = tile::negotiate(tile::content{format::png, encoding::gzip, gz}, AcceptEncoding("br"));
    CHECK(c.enc == encoding::uncompressed);
    CHECK(c.data == png_tile);
    CHECK(tile::classify(c.data) == tile::info{format::png, encoding::uncompressed});
  }

  SECTION("identity excluded") {
    CHECK_THROWS_AS(tile::negotiate(tile::content{format::png, encoding::gzip, gz},
                                    AcceptEncoding("br, identity;q=0")),
                    http::not_acceptable);
  }
}

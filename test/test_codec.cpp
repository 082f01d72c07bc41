/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/codec.hpp"
#include "tilecore/http.hpp"
#include "tilecore/options.hpp"

#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace po = boost::program_options;

using tile::encoding;

namespace {

std::string sample_tile() {
  std::string result;
  for (int i = 0; i < 2000; ++i)
    result += static_cast<char>(i % 251);
  return result;
}

} // anonymous namespace

TEST_CASE("Uncompressed is a no-op", "[codec]") {
  CHECK(tile::compress("abc", encoding::uncompressed) == "abc");
  CHECK(tile::decompress("abc", encoding::uncompressed) == "abc");
  CHECK(tile::is_supported(encoding::uncompressed));
}

TEST_CASE("zlib codecs", "[codec]") {
  const auto data = sample_tile();

  REQUIRE(tile::is_supported(encoding::gzip));
  REQUIRE(tile::is_supported(encoding::zlib));

  auto gz = tile::compress(data, encoding::gzip);
  CHECK(static_cast<unsigned char>(gz[0]) == 0x1F);
  CHECK(static_cast<unsigned char>(gz[1]) == 0x8B);
  CHECK(tile::decompress(gz, encoding::gzip) == data);

  auto z = tile::compress(data, encoding::zlib);
  CHECK(static_cast<unsigned char>(z[0]) == 0x78);
  CHECK(tile::decompress(z, encoding::zlib) == data);

  // gzip and zlib framing are not interchangeable
  CHECK_THROWS_AS(tile::decompress(gz, encoding::zlib), std::runtime_error);
}

TEST_CASE("Compression level follows the settings", "[codec]") {
  const std::string data(100000, 'a');

  po::variables_map vm;
  vm.emplace("deflate-level", po::variable_value(1, false));
  global_settings::set_configuration(std::make_unique<global_settings_via_options>(vm));
  auto fast = tile::compress(data, encoding::zlib);

  vm.clear();
  vm.emplace("deflate-level", po::variable_value(9, false));
  global_settings::set_configuration(std::make_unique<global_settings_via_options>(vm));
  auto best = tile::compress(data, encoding::zlib);

  global_settings::set_configuration(std::make_unique<global_settings_default>());

  // second byte of the zlib header carries the level
  CHECK(static_cast<unsigned char>(fast[1]) == 0x01);
  CHECK(static_cast<unsigned char>(best[1]) == 0xDA);
  CHECK(tile::decompress(fast, encoding::zlib) == data);
}

TEST_CASE("Corrupt and truncated input", "[codec]") {
  const auto gz = tile::compress(sample_tile(), encoding::gzip);

  CHECK_THROWS_AS(tile::decompress(gz.substr(0, gz.size() - 10), encoding::gzip), std::runtime_error);
  CHECK_THROWS_AS(tile::decompress("not compressed at all", encoding::gzip), std::runtime_error);
}

#if HAVE_BROTLI
TEST_CASE("brotli codec", "[codec]") {
  const auto data = sample_tile();
  REQUIRE(tile::is_supported(encoding::brotli));
  CHECK(tile::decompress(tile::compress(data, encoding::brotli), encoding::brotli) == data);
  CHECK_THROWS_AS(tile::decompress("\xff\xff\xff", encoding::brotli), std::runtime_error);
}
#else
TEST_CASE("brotli codec unavailable", "[codec]") {
  CHECK_FALSE(tile::is_supported(encoding::brotli));
  CHECK_THROWS_AS(tile::compress("abc", encoding::brotli), http::server_error);
}
#endif

#if HAVE_ZSTD
TEST_CASE("zstd codec", "[codec]") {
  const auto data = sample_tile();
  REQUIRE(tile::is_supported(encoding::zstd));
  auto compressed = tile::compress(data, encoding::zstd);
  CHECK(tile::decompress(compressed, encoding::zstd) == data);
  CHECK_THROWS_AS(tile::decompress(compressed.substr(0, compressed.size() / 2), encoding::zstd),
                  std::runtime_error);
}
#else
TEST_CASE("zstd codec unavailable", "[codec]") {
  CHECK_FALSE(tile::is_supported(encoding::zstd));
  CHECK_THROWS_AS(tile::decompress("abc", encoding::zstd), http::server_error);
}
#endif

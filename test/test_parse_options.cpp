/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */


#include "tilecore/options.hpp"

#include <string>
#include <stdexcept>
#include <vector>

#include <boost/program_options.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace po = boost::program_options;

void check_options(const po::variables_map& options)
{
  global_settings::set_configuration(std::make_unique<global_settings_via_options>(options));
}

TEST_CASE("No command line options", "[options]") {
  po::variables_map vm;
  REQUIRE_NOTHROW(check_options(vm));

  CHECK( global_settings::get_strict_function_names() == false );
  CHECK( global_settings::get_brotli_quality() == 5 );
  CHECK( global_settings::get_deflate_level() == 6 );
  CHECK( global_settings::get_zstd_level() == 3 );
  CHECK( global_settings::get_function_schemas().empty() );
}

TEST_CASE("Invalid brotli-quality", "[options]") {
  po::variables_map vm;
  vm.emplace("brotli-quality", po::variable_value(-1, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);

  vm.clear();
  vm.emplace("brotli-quality", po::variable_value(12, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid deflate-level", "[options]") {
  po::variables_map vm;
  vm.emplace("deflate-level", po::variable_value(0, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);

  vm.clear();
  vm.emplace("deflate-level", po::variable_value(10, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid zstd-level", "[options]") {
  po::variables_map vm;
  vm.emplace("zstd-level", po::variable_value(0, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);

  vm.clear();
  vm.emplace("zstd-level", po::variable_value(23, false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);
}

TEST_CASE("Invalid function-schemas", "[options]") {
  po::variables_map vm;
  vm.emplace("function-schemas", po::variable_value(std::string(" , ,"), false));
  REQUIRE_THROWS_AS(check_options(vm), std::invalid_argument);
}

TEST_CASE("Options fall back to given settings", "[options]") {
  po::variables_map vm;
  vm.emplace("zstd-level", po::variable_value(7, false));

  global_settings_via_options base(vm);

  po::variables_map vm2;
  vm2.emplace("deflate-level", po::variable_value(9, false));
  global_settings::set_configuration(std::make_unique<global_settings_via_options>(vm2, base));

  CHECK( global_settings::get_zstd_level() == 7 );
  CHECK( global_settings::get_deflate_level() == 9 );
  CHECK( global_settings::get_brotli_quality() == 5 );
}

TEST_CASE("Set all supported options", "[options]") {
  po::variables_map vm;
  vm.emplace("strict-function-names", po::variable_value(true, false));
  vm.emplace("brotli-quality", po::variable_value(11, false));
  vm.emplace("deflate-level", po::variable_value(1, false));
  vm.emplace("zstd-level", po::variable_value(19, false));
  vm.emplace("function-schemas", po::variable_value(std::string("tiles, public"), false));
  REQUIRE_NOTHROW(check_options(vm));

  REQUIRE( global_settings::get_strict_function_names() == true );
  REQUIRE( global_settings::get_brotli_quality() == 11 );
  REQUIRE( global_settings::get_deflate_level() == 1 );
  REQUIRE( global_settings::get_zstd_level() == 19 );
  REQUIRE( global_settings::get_function_schemas() == std::vector<std::string>{"tiles", "public"} );
}

TEST_CASE("Options description lists all options", "[options]") {
  auto desc = tile_options_description();
  for (const auto *name : {"strict-function-names", "brotli-quality", "deflate-level",
                           "zstd-level", "function-schemas"}) {
    CHECK(desc.find_nothrow(name, false) != nullptr);
  }
}

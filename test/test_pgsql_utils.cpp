/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/backend/pgsql/utils.hpp"

#include <string>
#include <vector>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using strings = std::vector<std::string>;

TEST_CASE("Parse empty arrays", "[pgsql]") {
  CHECK(psql_array_to_vector(std::string_view("")).empty());
  CHECK(psql_array_to_vector(std::string_view("{}")).empty());
  CHECK(psql_array_to_vector(std::string_view("{NULL}")).empty());
}

TEST_CASE("Parse argument names", "[pgsql]") {
  CHECK(psql_array_to_vector(std::string_view("{z,x,y,query_params}")) ==
        strings{"z", "x", "y", "query_params"});
}

TEST_CASE("Parse argument modes", "[pgsql]") {
  CHECK(psql_array_to_vector(std::string_view("{i,i,i,o,o}")) == strings{"i", "i", "i", "o", "o"});
}

TEST_CASE("Parse quoted elements", "[pgsql]") {
  CHECK(psql_array_to_vector(std::string_view(R"({integer,"double precision","a,b","say \"hi\""})")) ==
        strings{"integer", "double precision", "a,b", "say \"hi\""});
  CHECK(psql_array_to_vector(std::string_view(R"({"back\\slash","{braces}"})")) ==
        strings{"back\\slash", "{braces}"});
}

TEST_CASE("Parse NULL and empty elements", "[pgsql]") {
  CHECK(psql_array_to_vector(std::string_view(R"({z,NULL,"",y})")) == strings{"z", "", "", "y"});
  CHECK(psql_array_to_vector(std::string_view(R"({"NULL"})")) == strings{"NULL"});
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef FUNCTION_SIGNATURE_HPP
#define FUNCTION_SIGNATURE_HPP

#include "tilecore/tile_format.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct function_argument {
  std::string name;
  std::string type;

  bool operator==(const function_argument &) const = default;
};

/**
 * What a function returns, as the database describes it. Record returns
 * list their output columns, scalar returns have none.
 */
struct function_return {
  std::string type;
  std::vector<function_argument> columns;

  bool operator==(const function_return &) const = default;
};

/**
 * A database function as described by the catalog, before anything is
 * known about whether it can serve tiles.
 */
struct function_signature {
  std::string schema;
  std::string name;
  std::vector<function_argument> arguments;
  function_return returns;

  bool operator==(const function_signature &) const = default;
};

enum class return_shape {
  scalar_bytea,   // returns bytea
  record_single,  // returns record(bytea)
  record_pair     // returns record(bytea, text), the text being an ETag
};

std::string to_string(return_shape shape);

/**
 * How to call a function which was accepted as a tile source. Built once
 * per catalog pass and never changed afterwards.
 */
struct call_plan {
  std::string source_id;
  std::string schema;
  std::string function;

  // positions of the arguments in the declared argument list
  std::size_t z_index = 0;
  std::size_t x_index = 0;
  std::size_t y_index = 0;
  std::optional<std::size_t> query_index;
  std::size_t argument_count = 0;

  // "json" or "jsonb", only meaningful with a query argument
  std::string query_type;

  return_shape shape = return_shape::scalar_bytea;

  // function sources produce vector tiles unless their bytes say otherwise
  tile::format format = tile::format::mvt;

  bool operator==(const call_plan &) const = default;

  /**
   * SQL which calls the function. Parameters are always $1 = z, $2 = x,
   * $3 = y and, with a query argument, $4 = query, placed at the
   * positions the function declares them.
   */
  std::string sql() const;
};

#endif /* FUNCTION_SIGNATURE_HPP */

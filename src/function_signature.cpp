/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/function_signature.hpp"
#include "tilecore/util.hpp"

#include <fmt/core.h>

std::string to_string(return_shape shape) {
  switch (shape) {
  case return_shape::scalar_bytea:
    return "bytea";
  case return_shape::record_single:
    return "record(bytea)";
  case return_shape::record_pair:
    return "record(bytea, text)";
  }
  return "unknown";
}

std::string call_plan::sql() const {

  std::vector<std::string> args(argument_count);

  args[z_index] = "$1::integer";
  args[x_index] = "$2::integer";
  args[y_index] = "$3::integer";
  if (query_index)
    args[*query_index] = fmt::format("$4::{}", query_type);

  return fmt::format("SELECT * FROM {}.{}({})",
                     quote_identifier(schema), quote_identifier(function),
                     fmt::join(args, ", "));
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <pqxx/pqxx>

#include "tilecore/backend/pgsql/utils.hpp"

void check_postgres_version(const pqxx::connection &conn) {
  // prokind, used by the catalog query, appeared in 11
  auto version = conn.server_version();
  if (version < 110000) {
    throw std::runtime_error(fmt::format(
      "Expected Postgres version 11+, currently installed version {}", version));
  }
}

std::vector<std::string> psql_array_to_vector(const pqxx::field& field, int size_hint) {
  if (field.is_null())
    return {};
  return psql_array_to_vector(std::string_view(field.c_str(), field.size()), size_hint);
}

std::vector<std::string> psql_array_to_vector(std::string_view str, int size_hint) {
  std::vector<std::string> strs;
  std::string value;
  bool quoted_value = false;
  bool was_quoted = false;
  bool escaped = false;

  if (size_hint > 0)
    strs.reserve(size_hint);

  if (str.size() < 2 || str == "{}" || str == "{NULL}")
    return strs;

  auto emit = [&]() {
    // an unquoted NULL element is an SQL null, which we treat as empty
    if (!was_quoted && value == "NULL")
      value.clear();
    strs.emplace_back(std::move(value));
    value.clear();
    was_quoted = false;
  };

  for (std::size_t i = 1; i < str.size(); ++i) {
    const char c = str[i];

    if (escaped) {
      value += c;
      escaped = false;
    } else if (c == '\\') {
      escaped = true;
    } else if (c == '"') {
      quoted_value = !quoted_value;
      was_quoted = true;
    } else if (quoted_value) {
      value += c;
    } else if (c == ',' || c == '}') {
      emit();
    } else {
      value += c;
    }
  }
  return strs;
}

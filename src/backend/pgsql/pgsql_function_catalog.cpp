/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/backend/pgsql/pgsql_function_catalog.hpp"
#include "tilecore/backend/pgsql/utils.hpp"
#include "tilecore/logger.hpp"
#include "tilecore/util.hpp"

#include <chrono>

#include <fmt/core.h>

namespace {

// argument types come back as a text[] in declaration order, covering all
// arguments (including OUT and TABLE ones) whenever proargmodes is set.
const std::string functions_query = R"(
  SELECT n.nspname AS schema,
         p.proname AS name,
         p.proargnames AS arg_names,
         p.proargmodes AS arg_modes,
         ARRAY(SELECT format_type(a.t, NULL)
               FROM unnest(coalesce(p.proallargtypes, p.proargtypes::oid[]))
                    WITH ORDINALITY AS a(t, i)
               ORDER BY a.i) AS arg_types,
         format_type(p.prorettype, NULL) AS return_type
  FROM pg_catalog.pg_proc p
  JOIN pg_catalog.pg_namespace n ON n.oid = p.pronamespace
  WHERE p.prokind = 'f'
    AND n.nspname NOT IN ('pg_catalog', 'information_schema')
    AND n.nspname NOT LIKE 'pg\_%'
    AND (cardinality($1::text[]) = 0 OR n.nspname = ANY($1::text[]))
  ORDER BY n.nspname, p.proname, p.oid
)";

function_signature to_signature(const pqxx::row &row) {

  function_signature sig;
  sig.schema = row["schema"].as<std::string>();
  sig.name = row["name"].as<std::string>();
  sig.returns.type = row["return_type"].as<std::string>();

  const auto types = psql_array_to_vector(row["arg_types"]);
  const auto names = psql_array_to_vector(row["arg_names"], types.size());
  const auto modes = psql_array_to_vector(row["arg_modes"], types.size());

  for (std::size_t i = 0; i < types.size(); ++i) {
    function_argument arg{i < names.size() ? names[i] : std::string{}, types[i]};

    // i = IN, b = INOUT, v = VARIADIC, o = OUT, t = TABLE column
    const auto mode = i < modes.size() ? modes[i] : std::string{"i"};

    if (mode == "o" || mode == "t") {
      sig.returns.columns.push_back(std::move(arg));
    } else if (mode == "b") {
      sig.returns.columns.push_back(arg);
      sig.arguments.push_back(std::move(arg));
    } else {
      sig.arguments.push_back(std::move(arg));
    }
  }

  // a single OUT parameter makes the function return that type directly
  if (!iequals(sig.returns.type, "record"))
    sig.returns.columns.clear();

  return sig;
}

} // anonymous namespace

pgsql_function_catalog::pgsql_function_catalog(pqxx::connection &conn,
                                               std::vector<std::string> schemas)
    : m_connection(conn), m_schemas(std::move(schemas)) {}

std::vector<function_signature> pgsql_function_catalog::functions() {

  check_postgres_version(m_connection);

  const auto start = std::chrono::steady_clock::now();

  pqxx::read_transaction txn(m_connection);
  auto res = txn.exec_params(functions_query, m_schemas);

  std::vector<function_signature> result;
  result.reserve(res.size());
  for (const auto &row : res)
    result.push_back(to_signature(row));

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  logger::message(fmt::format("Read {:d} functions from schemas [{}] in {:d} ms",
                              result.size(),
                              m_schemas.empty() ? std::string("all") : to_string(m_schemas),
                              elapsed.count()));
  return result;
}

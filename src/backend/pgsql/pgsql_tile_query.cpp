/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/backend/pgsql/pgsql_tile_query.hpp"
#include "tilecore/logger.hpp"

#include <chrono>
#include <cstddef>

#include <fmt/core.h>

namespace {

std::string to_bytes(const pqxx::field &field) {
  if (field.is_null())
    return {};

  auto raw = field.as<std::basic_string<std::byte>>();
  return std::string(reinterpret_cast<const char *>(raw.data()), raw.size());
}

} // anonymous namespace

pgsql_tile_query::pgsql_tile_query(pqxx::connection &conn)
    : m_connection(conn) {}

const std::string &pgsql_tile_query::prepare(const call_plan &plan) {

  auto sql = plan.sql();

  auto itr = m_prepared.find(sql);
  if (itr != m_prepared.end())
    return itr->second;

  auto name = fmt::format("tile_query_{:d}", m_prepared.size());
  m_connection.prepare(name, sql);
  logger::message(fmt::format("Prepared statement {} for tile source '{}': {}",
                              name, plan.source_id, sql));

  return m_prepared.emplace(std::move(sql), std::move(name)).first->second;
}

tile_row pgsql_tile_query::execute(const call_plan &plan, int32_t z, int32_t x,
                                   int32_t y, const std::string &query_json) {

  const auto &statement = prepare(plan);

  const auto start = std::chrono::steady_clock::now();

  pqxx::read_transaction txn(m_connection);
  auto res = plan.query_index
      ? txn.exec_prepared(statement, z, x, y, query_json)
      : txn.exec_prepared(statement, z, x, y);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  logger::message(fmt::format("Executed prepared statement {} for tile {}/{}/{} of source '{}' in {:d} ms",
                              statement, z, x, y, plan.source_id, elapsed.count()));

  tile_row row;
  if (res.empty())
    return row;

  const auto &first = res[0];
  row.data = to_bytes(first[0]);

  if (plan.shape == return_shape::record_pair && !first[1].is_null())
    row.etag = first[1].as<std::string>();

  return row;
}

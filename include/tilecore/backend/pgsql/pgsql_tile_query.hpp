/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef PGSQL_TILE_QUERY_HPP
#define PGSQL_TILE_QUERY_HPP

#include "tilecore/tile_pipeline.hpp"

#include <map>
#include <string>

#include <pqxx/pqxx>

/**
 * Calls tile functions over a caller-owned connection. Statements are
 * prepared on first use and kept for the lifetime of the connection.
 * Not thread-safe, use one instance per connection.
 */
class pgsql_tile_query : public tile_query {
public:
  explicit pgsql_tile_query(pqxx::connection &conn);

  tile_row execute(const call_plan &plan, int32_t z, int32_t x, int32_t y,
                   const std::string &query_json) override;

private:
  const std::string &prepare(const call_plan &plan);

  pqxx::connection &m_connection;

  // statement name by SQL text
  std::map<std::string, std::string> m_prepared;
};

#endif /* PGSQL_TILE_QUERY_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef PGSQL_FUNCTION_CATALOG_HPP
#define PGSQL_FUNCTION_CATALOG_HPP

#include "tilecore/catalog.hpp"

#include <string>
#include <vector>

#include <pqxx/pqxx>

/**
 * Lists the functions of a PostgreSQL database from pg_proc. System
 * schemas are never listed. The connection is owned by the caller and
 * must outlive the catalog.
 */
class pgsql_function_catalog : public function_catalog {
public:
  // an empty schema list means all schemas
  pgsql_function_catalog(pqxx::connection &conn, std::vector<std::string> schemas);

  std::vector<function_signature> functions() override;

private:
  pqxx::connection &m_connection;
  std::vector<std::string> m_schemas;
};

#endif /* PGSQL_FUNCTION_CATALOG_HPP */

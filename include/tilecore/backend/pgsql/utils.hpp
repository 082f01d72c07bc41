/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef PGSQL_UTILS_HPP
#define PGSQL_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

#include <pqxx/pqxx>

// throws an exception if the server version does not match the minimum requirements
void check_postgres_version(const pqxx::connection &conn);

// parses psql array based on specs given
// https://www.postgresql.org/docs/current/static/arrays.html#ARRAYS-IO
std::vector<std::string> psql_array_to_vector(const pqxx::field& field, int size_hint = 0);
std::vector<std::string> psql_array_to_vector(std::string_view str, int size_hint = 0);

#endif /* PGSQL_UTILS_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef QUERY_PARAMS_HPP
#define QUERY_PARAMS_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>

using query_params_t = std::vector<std::pair<std::string, std::string> >;

/**
 * Folds request query parameters into the JSON object passed as the query
 * argument of a function source.
 *
 * Every value which parses as JSON is used as parsed ("42" becomes 42,
 * "[1,2]" an array); anything else becomes a JSON string. Repeated keys are
 * collected into an array in the order they appeared. Keys are written in
 * sorted order, so equal parameter sets always give equal documents.
 *
 * No parameters give "{}".
 */
std::string encode_query_params(const query_params_t &params);

/**
 * Splits a raw query string into url-decoded key / value pairs, leaving out
 * the keys the server reserves for itself.
 */
query_params_t parse_query_string(const std::string &query_string,
                                  const std::set<std::string> &reserved = {});

#endif /* QUERY_PARAMS_HPP */

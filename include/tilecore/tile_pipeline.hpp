/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef TILE_PIPELINE_HPP
#define TILE_PIPELINE_HPP

#include "tilecore/encoding_negotiator.hpp"
#include "tilecore/function_signature.hpp"
#include "tilecore/http.hpp"
#include "tilecore/query_params.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct tile_row {
  std::string data;
  std::optional<std::string> etag;
};

/**
 * Runs a call plan against whatever stores the tile functions.
 */
class tile_query {
public:
  virtual ~tile_query() = default;

  /**
   * query_json is only passed on to plans which take a query argument.
   */
  virtual tile_row execute(const call_plan &plan, int32_t z, int32_t x, int32_t y,
                           const std::string &query_json) = 0;
};

struct tile_response {
  std::string data;
  std::string content_type;
  std::optional<std::string> content_encoding;
  std::optional<std::string> etag;

  http::headers_t headers() const;
};

/**
 * Fetches a single tile and prepares it for sending: sniffs what the
 * function returned, checks format and encoding go together and
 * recompresses for the client where needed.
 *
 * @throws http::exception for anything the client should be told about
 */
tile_response render_tile(const call_plan &plan, tile_query &executor,
                          int32_t z, int32_t x, int32_t y,
                          const query_params_t &params,
                          const tile::AcceptEncoding &accept);

#endif /* TILE_PIPELINE_HPP */

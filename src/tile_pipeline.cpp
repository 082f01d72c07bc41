/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/tile_pipeline.hpp"
#include "tilecore/mime_types.hpp"
#include "tilecore/tile_headers.hpp"
#include "tilecore/tile_sniffer.hpp"

#include <utility>

http::headers_t tile_response::headers() const {
  http::headers_t result;
  result.emplace_back("Content-Type", content_type);
  if (content_encoding)
    result.emplace_back("Content-Encoding", *content_encoding);
  result.emplace_back("Vary", "Accept-Encoding");
  if (etag)
    result.emplace_back("ETag", "\"" + *etag + "\"");
  return result;
}

tile_response render_tile(const call_plan &plan, tile_query &executor,
                          int32_t z, int32_t x, int32_t y,
                          const query_params_t &params,
                          const tile::AcceptEncoding &accept) {

  std::string query_json;
  if (plan.query_index)
    query_json = encode_query_params(params);

  auto row = executor.execute(plan, z, x, y, query_json);

  tile_response response;
  response.etag = std::move(row.etag);

  if (row.data.empty()) {
    response.content_type = mime::to_string(tile::to_mime(plan.format));
    return response;
  }

  const auto detected = tile::classify(row.data, plan.format);
  tile::validate(detected.fmt, detected.enc);

  auto served = tile::negotiate(tile::content{detected.fmt, detected.enc, std::move(row.data)}, accept);
  auto hdrs = tile::to_headers(served.fmt, served.enc);

  response.data = std::move(served.data);
  response.content_type = std::move(hdrs.content_type);
  response.content_encoding = std::move(hdrs.content_encoding);
  return response;
}

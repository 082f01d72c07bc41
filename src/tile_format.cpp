/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/tile_format.hpp"
#include "tilecore/util.hpp"

#include <map>

namespace tile {

namespace {

const std::map<std::string, format, std::less<>> FORMAT_NAMES = {
  {"pbf",  format::mvt},
  {"mvt",  format::mvt},
  {"png",  format::png},
  {"jpg",  format::jpeg},
  {"jpeg", format::jpeg},
  {"webp", format::webp},
  {"gif",  format::gif},
  {"json", format::json}
};

} // anonymous namespace

mime::type to_mime(format f) {
  switch (f) {
  case format::mvt:
    return mime::type::application_x_protobuf;
  case format::png:
    return mime::type::image_png;
  case format::jpeg:
    return mime::type::image_jpeg;
  case format::webp:
    return mime::type::image_webp;
  case format::gif:
    return mime::type::image_gif;
  case format::json:
    return mime::type::application_json;
  case format::unknown:
    break;
  }
  return mime::type::unspecified_type;
}

std::string to_string(format f) {
  switch (f) {
  case format::mvt:     return "mvt";
  case format::png:     return "png";
  case format::jpeg:    return "jpeg";
  case format::webp:    return "webp";
  case format::gif:     return "gif";
  case format::json:    return "json";
  case format::unknown: break;
  }
  return "unknown";
}

std::string to_string(encoding e) {
  switch (e) {
  case encoding::gzip:         return "gzip";
  case encoding::zlib:         return "zlib";
  case encoding::brotli:       return "brotli";
  case encoding::zstd:         return "zstd";
  case encoding::uncompressed: break;
  }
  return "none";
}

std::optional<std::string> content_encoding_token(encoding e) {
  switch (e) {
  case encoding::gzip:         return "gzip";
  case encoding::zlib:         return "deflate";
  case encoding::brotli:       return "br";
  case encoding::zstd:         return "zstd";
  case encoding::uncompressed: break;
  }
  return {};
}

std::optional<encoding> parse_encoding_token(std::string_view token) {
  if (iequals(token, "identity"))
    return encoding::uncompressed;
  if (iequals(token, "gzip") || iequals(token, "x-gzip"))
    return encoding::gzip;
  if (iequals(token, "deflate"))
    return encoding::zlib;
  if (iequals(token, "br"))
    return encoding::brotli;
  if (iequals(token, "zstd"))
    return encoding::zstd;
  return {};
}

std::optional<format> parse_format(std::string_view name) {

  auto trimmed = trim(name);

  auto itr = FORMAT_NAMES.find(to_lower(trimmed));
  if (itr != FORMAT_NAMES.end())
    return itr->second;

  switch (mime::parse_from(to_lower(trimmed))) {
  case mime::type::application_x_protobuf:
    return format::mvt;
  case mime::type::image_png:
    return format::png;
  case mime::type::image_jpeg:
    return format::jpeg;
  case mime::type::image_webp:
    return format::webp;
  case mime::type::image_gif:
    return format::gif;
  case mime::type::application_json:
    return format::json;
  case mime::type::unspecified_type:
    break;
  }
  return {};
}

std::ostream &operator<<(std::ostream &out, format f) {
  return out << to_string(f);
}

std::ostream &operator<<(std::ostream &out, encoding e) {
  return out << to_string(e);
}

std::ostream &operator<<(std::ostream &out, const info &i) {
  out << i.fmt;
  if (i.enc != encoding::uncompressed)
    out << "-" << i.enc;
  return out;
}

} // namespace tile

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/mime_types.hpp"
#include <stdexcept>


namespace mime {
std::string to_string(type t) {
  if (mime::type::application_x_protobuf == t) {
    return "application/x-protobuf";
  } else if (mime::type::image_png == t) {
    return "image/png";
  } else if (mime::type::image_jpeg == t) {
    return "image/jpeg";
  } else if (mime::type::image_webp == t) {
    return "image/webp";
  } else if (mime::type::image_gif == t) {
    return "image/gif";
  } else if (mime::type::application_json == t) {
    return "application/json";
  } else {
    throw std::runtime_error("No string conversion for unspecified MIME type.");
  }
}

type parse_from(std::string_view name) {

  if (name == "application/x-protobuf") {
    return mime::type::application_x_protobuf;
  } else if (name == "application/vnd.mapbox-vector-tile") {   // registered alias
    return mime::type::application_x_protobuf;
  } else if (name == "image/png") {
    return mime::type::image_png;
  } else if (name == "image/jpeg") {
    return mime::type::image_jpeg;
  } else if (name == "image/webp") {
    return mime::type::image_webp;
  } else if (name == "image/gif") {
    return mime::type::image_gif;
  } else if (name == "application/json") {
    return mime::type::application_json;
  }

  return mime::type::unspecified_type;
}
}

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef MIME_TYPES_HPP
#define MIME_TYPES_HPP

#include <string>
#include <string_view>

/**
 * set of MIME types a tile payload can be served as.
 */
namespace mime {
enum class type {
  unspecified_type, // a "null" type, used to indicate no choice.
  application_x_protobuf,
  image_png,
  image_jpeg,
  image_webp,
  image_gif,
  application_json
};

std::string to_string(type);
type parse_from(std::string_view);
}

#endif /* MIME_TYPES_HPP */

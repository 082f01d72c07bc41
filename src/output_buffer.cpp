/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/output_buffer.hpp"

#include <new>

int string_output_buffer::write(const char *buffer, int len) noexcept {
  if (len < 0)
    return -1;

  try {
    m_data.append(buffer, len);
  } catch (const std::bad_alloc &) {
    return -1;
  }
  return len;
}

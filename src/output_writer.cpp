/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/output_writer.hpp"

output_writer::write_error::write_error(const char *message)
    : std::runtime_error(message) {}

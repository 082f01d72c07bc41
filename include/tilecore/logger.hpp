/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <string_view>

/**
 * Contains support for logging.
 */
namespace logger {

/**
 * Initialise logging. Messages are appended to the given file.
 */
void initialise(const std::string &filename);

/**
 * Log a message.
 */
void message(std::string_view m);

/**
 * Log a message which points at a problem in the served data, for
 * example a rejected catalog function. Prefixed so it can be grepped.
 */
void warning(std::string_view m);
}

#endif /* LOGGER_HPP */

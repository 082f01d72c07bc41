/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef FUNCTION_RESOLVER_HPP
#define FUNCTION_RESOLVER_HPP

#include "tilecore/function_signature.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * A catalog function which cannot be used as a tile source. Only ever
 * escapes bind_call_plan(); resolve_catalog() turns it into a rejection.
 */
class invalid_function_signature : public std::runtime_error {
public:
  explicit invalid_function_signature(const std::string &message);
};

struct rejection {
  std::string schema;
  std::string function;
  std::string reason;

  bool operator==(const rejection &) const = default;
};

/**
 * Result of one catalog pass: the accepted call plans by source id, and
 * what was left out and why.
 */
struct catalog_snapshot {
  std::uint64_t version = 0;
  std::map<std::string, call_plan> plans;
  std::vector<rejection> rejected;
  std::vector<std::string> warnings;

  /**
   * Looks up a source by id, case-insensitively. Returns nullptr if there
   * is no such source.
   */
  const call_plan *find(std::string_view source_id) const;
};

/**
 * Checks a single function against the tile function call shape
 *
 *   f(z|zoom integer, x integer, y integer[, query json|jsonb])
 *     -> bytea | record(bytea) | record(bytea, text)
 *
 * in any argument order, and returns how to call it.
 *
 * @throws invalid_function_signature naming the first problem found
 */
call_plan bind_call_plan(const function_signature &sig);

/**
 * Resolves every candidate on its own; one bad function never stops the
 * pass. Source ids are the case-folded function names. When two functions
 * fold to the same id the later one replaces the earlier one with a
 * warning, or with strict_names is rejected and the earlier one kept.
 *
 * The same candidates always give the same snapshot. The version is left
 * at 0 for the registry to assign.
 */
catalog_snapshot resolve_catalog(const std::vector<function_signature> &candidates,
                                 bool strict_names);

#endif /* FUNCTION_RESOLVER_HPP */

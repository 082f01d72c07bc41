/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/function_resolver.hpp"
#include "tilecore/logger.hpp"
#include "tilecore/util.hpp"

#include <optional>
#include <string_view>

#include <fmt/core.h>

namespace {

// lower case, without a pg_catalog. qualification
std::string normalize_type(std::string_view type) {
  auto result = to_lower(trim(type));
  constexpr std::string_view prefix = "pg_catalog.";
  if (result.starts_with(prefix))
    result.erase(0, prefix.size());
  return result;
}

bool is_integer(std::string_view type) {
  return type == "integer" || type == "int" || type == "int4";
}

bool is_json(std::string_view type) {
  return type == "json" || type == "jsonb";
}

void set_index(std::optional<std::size_t> &slot, std::size_t index,
               std::string_view what) {
  if (slot)
    throw invalid_function_signature(fmt::format("more than one {} argument", what));
  slot = index;
}

return_shape shape_of(const function_return &returns) {

  const auto type = normalize_type(returns.type);

  if (type == "bytea" && returns.columns.empty())
    return return_shape::scalar_bytea;

  if (type == "record") {
    const auto &cols = returns.columns;

    if (cols.size() == 1 && normalize_type(cols[0].type) == "bytea")
      return return_shape::record_single;

    if (cols.size() == 2 && normalize_type(cols[0].type) == "bytea" &&
        normalize_type(cols[1].type) == "text")
      return return_shape::record_pair;

    std::vector<std::string> types;
    for (const auto &col : cols)
      types.push_back(normalize_type(col.type));

    throw invalid_function_signature(fmt::format(
        "returns record({}), expected record(bytea) or record(bytea, text)",
        to_string(types)));
  }

  throw invalid_function_signature(fmt::format(
      "returns {}, expected bytea, record(bytea) or record(bytea, text)",
      type.empty() ? "nothing" : type));
}

} // anonymous namespace

invalid_function_signature::invalid_function_signature(const std::string &message)
    : std::runtime_error(message) {}

const call_plan *catalog_snapshot::find(std::string_view source_id) const {
  auto itr = plans.find(to_lower(source_id));
  if (itr == plans.end())
    return nullptr;
  return &itr->second;
}

call_plan bind_call_plan(const function_signature &sig) {

  std::optional<std::size_t> z, x, y, query;
  std::string query_type;

  for (std::size_t i = 0; i < sig.arguments.size(); ++i) {
    const auto &arg = sig.arguments[i];
    const auto name = to_lower(trim(std::string_view(arg.name)));
    const auto type = normalize_type(arg.type);

    if ((name == "z" || name == "zoom") && is_integer(type)) {
      set_index(z, i, "zoom");
    } else if (name == "x" && is_integer(type)) {
      set_index(x, i, "x");
    } else if (name == "y" && is_integer(type)) {
      set_index(y, i, "y");
    } else if (is_json(type)) {
      set_index(query, i, "json");
      query_type = type;
    } else {
      throw invalid_function_signature(fmt::format(
          "argument {} '{}' of type {} is not allowed", i + 1, arg.name, type));
    }
  }

  if (!z)
    throw invalid_function_signature("missing integer argument z or zoom");
  if (!x)
    throw invalid_function_signature("missing integer argument x");
  if (!y)
    throw invalid_function_signature("missing integer argument y");

  call_plan plan;
  plan.source_id = to_lower(sig.name);
  plan.schema = sig.schema;
  plan.function = sig.name;
  plan.z_index = *z;
  plan.x_index = *x;
  plan.y_index = *y;
  plan.query_index = query;
  plan.argument_count = sig.arguments.size();
  plan.query_type = query_type;
  plan.shape = shape_of(sig.returns);
  return plan;
}

catalog_snapshot resolve_catalog(const std::vector<function_signature> &candidates,
                                 bool strict_names) {

  catalog_snapshot snapshot;

  for (const auto &sig : candidates) {
    const auto qualified = fmt::format("{}.{}", sig.schema, sig.name);

    call_plan plan;
    try {
      plan = bind_call_plan(sig);
    } catch (const invalid_function_signature &e) {
      logger::warning(fmt::format("Function {} is not a valid tile source: {}", qualified, e.what()));
      snapshot.rejected.push_back(rejection{sig.schema, sig.name, e.what()});
      continue;
    }

    auto existing = snapshot.plans.find(plan.source_id);
    if (existing != snapshot.plans.end()) {
      const auto previous = fmt::format("{}.{}", existing->second.schema, existing->second.function);

      if (strict_names) {
        auto reason = fmt::format("source id '{}' is already used by {}", plan.source_id, previous);
        logger::warning(fmt::format("Function {} is not a valid tile source: {}", qualified, reason));
        snapshot.rejected.push_back(rejection{sig.schema, sig.name, std::move(reason)});
        continue;
      }

      auto warning = fmt::format("Function {} replaces {} as tile source '{}'",
                                 qualified, previous, plan.source_id);
      logger::warning(warning);
      snapshot.warnings.push_back(std::move(warning));
    }

    logger::message(fmt::format("Function {} serves tile source '{}' ({})",
                                qualified, plan.source_id, to_string(plan.shape)));
    snapshot.plans.insert_or_assign(plan.source_id, std::move(plan));
  }

  return snapshot;
}

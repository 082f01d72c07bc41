/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/catalog.hpp"
#include "tilecore/logger.hpp"
#include "tilecore/options.hpp"

#include <chrono>

#include <fmt/core.h>

catalog_registry::catalog_registry()
    : m_current(std::make_shared<const catalog_snapshot>()) {}

std::shared_ptr<const catalog_snapshot> catalog_registry::current() const {
  return m_current.load();
}

std::shared_ptr<const catalog_snapshot>
catalog_registry::publish(catalog_snapshot snapshot) {

  std::lock_guard<std::mutex> lock(m_publish_mutex);

  snapshot.version = m_current.load()->version + 1;
  auto published = std::make_shared<const catalog_snapshot>(std::move(snapshot));
  m_current.store(published);

  logger::message(fmt::format("Published tile catalog version {} with {} sources, {} rejected",
                              published->version, published->plans.size(),
                              published->rejected.size()));
  return published;
}

std::shared_ptr<const catalog_snapshot>
catalog_registry::refresh(function_catalog &catalog) {

  const auto start = std::chrono::steady_clock::now();

  auto candidates = catalog.functions();
  auto snapshot = resolve_catalog(candidates, global_settings::get_strict_function_names());

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  logger::message(fmt::format("Resolved {} catalog functions in {} ms",
                              candidates.size(), elapsed.count()));

  return publish(std::move(snapshot));
}

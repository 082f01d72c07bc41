/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef CATALOG_HPP
#define CATALOG_HPP

#include "tilecore/function_resolver.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

/**
 * Source of function descriptions, usually the database system catalog.
 */
class function_catalog {
public:
  virtual ~function_catalog() = default;

  virtual std::vector<function_signature> functions() = 0;
};

/**
 * Holds the catalog snapshot currently in use. Readers get an immutable
 * snapshot which stays valid for as long as they hold on to it, even when
 * a newer one is published meanwhile.
 */
class catalog_registry {
public:
  catalog_registry();

  catalog_registry(const catalog_registry &) = delete;
  catalog_registry &operator=(const catalog_registry &) = delete;

  std::shared_ptr<const catalog_snapshot> current() const;

  /**
   * Makes the snapshot current, numbering it one past the snapshot it
   * replaces. Returns what was published.
   */
  std::shared_ptr<const catalog_snapshot> publish(catalog_snapshot snapshot);

  /**
   * Reads all functions from the catalog, resolves them and publishes the
   * result. If reading the catalog throws, the current snapshot is kept
   * and the exception propagates.
   */
  std::shared_ptr<const catalog_snapshot> refresh(function_catalog &catalog);

private:
  std::atomic<std::shared_ptr<const catalog_snapshot>> m_current;
  std::mutex m_publish_mutex;
};

#endif /* CATALOG_HPP */

/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/options.hpp"
#include "tilecore/util.hpp"

#include <stdexcept>
#include <string_view>

global_settings_base::~global_settings_base() = default;

std::unique_ptr<global_settings_base> global_settings::settings = std::make_unique<global_settings_default>();


po::options_description tile_options_description() {
  po::options_description desc("Tile options");

  // clang-format off
  desc.add_options()
    ("strict-function-names", po::value<bool>(), "reject tile functions whose names collide instead of replacing the earlier one")
    ("brotli-quality", po::value<int>(), "brotli quality used when recompressing tiles (0-11)")
    ("deflate-level", po::value<int>(), "zlib level used when recompressing tiles as gzip or deflate (1-9)")
    ("zstd-level", po::value<int>(), "zstd level used when recompressing tiles (1-22)")
    ("function-schemas", po::value<std::string>(), "comma separated list of schemas searched for tile functions")
    ;
  // clang-format on

  return desc;
}

void global_settings_via_options::init_fallback_values(const global_settings_base &def) {

  m_strict_function_names = def.get_strict_function_names();
  m_brotli_quality = def.get_brotli_quality();
  m_deflate_level = def.get_deflate_level();
  m_zstd_level = def.get_zstd_level();
  m_function_schemas = def.get_function_schemas();
}

void global_settings_via_options::set_new_options(const po::variables_map &options) {

  set_strict_function_names(options);
  set_brotli_quality(options);
  set_deflate_level(options);
  set_zstd_level(options);
  set_function_schemas(options);
}

void global_settings_via_options::set_strict_function_names(const po::variables_map &options) {
  if (options.count("strict-function-names")) {
    m_strict_function_names = options["strict-function-names"].as<bool>();
  }
}

void global_settings_via_options::set_brotli_quality(const po::variables_map &options) {
  if (options.count("brotli-quality")) {
    auto quality = options["brotli-quality"].as<int>();
    if (quality < 0 || quality > 11)
      throw std::invalid_argument("brotli-quality must be between 0 and 11");
    m_brotli_quality = quality;
  }
}

void global_settings_via_options::set_deflate_level(const po::variables_map &options) {
  if (options.count("deflate-level")) {
    auto level = options["deflate-level"].as<int>();
    if (level < 1 || level > 9)
      throw std::invalid_argument("deflate-level must be between 1 and 9");
    m_deflate_level = level;
  }
}

void global_settings_via_options::set_zstd_level(const po::variables_map &options) {
  if (options.count("zstd-level")) {
    auto level = options["zstd-level"].as<int>();
    if (level < 1 || level > 22)
      throw std::invalid_argument("zstd-level must be between 1 and 22");
    m_zstd_level = level;
  }
}

void global_settings_via_options::set_function_schemas(const po::variables_map &options) {
  if (options.count("function-schemas")) {
    const auto schemas = options["function-schemas"].as<std::string>();

    std::vector<std::string> result;
    for (const auto &schema : split_trim(std::string_view(schemas), ',')) {
      result.emplace_back(schema);
    }

    if (result.empty())
      throw std::invalid_argument("function-schemas must name at least one schema");
    m_function_schemas = std::move(result);
  }
}

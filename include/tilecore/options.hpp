/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

class global_settings_base {

public:
  virtual ~global_settings_base();

  virtual bool get_strict_function_names() const = 0;
  virtual int get_brotli_quality() const = 0;
  virtual int get_deflate_level() const = 0;
  virtual int get_zstd_level() const = 0;
  virtual std::vector<std::string> get_function_schemas() const = 0;
};

class global_settings_default : public global_settings_base {

public:
  bool get_strict_function_names() const override {
    return false;
  }

  int get_brotli_quality() const override {
    return 5;
  }

  int get_deflate_level() const override {
    return 6;
  }

  int get_zstd_level() const override {
    return 3;
  }

  std::vector<std::string> get_function_schemas() const override {
    return {};  // default: all schemas
  }
};

class global_settings_via_options : public global_settings_base {

public:
  global_settings_via_options() = delete;

  explicit global_settings_via_options(const po::variables_map & options) {

    init_fallback_values(global_settings_default{}); // use default values as fallback
    set_new_options(options);
  }

  global_settings_via_options(const po::variables_map & options,
                              const global_settings_base & fallback) {

    init_fallback_values(fallback);
    set_new_options(options);
  }

  bool get_strict_function_names() const override {
    return m_strict_function_names;
  }

  int get_brotli_quality() const override {
    return m_brotli_quality;
  }

  int get_deflate_level() const override {
    return m_deflate_level;
  }

  int get_zstd_level() const override {
    return m_zstd_level;
  }

  std::vector<std::string> get_function_schemas() const override {
    return m_function_schemas;
  }

private:
  void init_fallback_values(const global_settings_base &def);
  void set_new_options(const po::variables_map &options);
  void set_strict_function_names(const po::variables_map &options);
  void set_brotli_quality(const po::variables_map &options);
  void set_deflate_level(const po::variables_map &options);
  void set_zstd_level(const po::variables_map &options);
  void set_function_schemas(const po::variables_map &options);

  bool m_strict_function_names;
  int m_brotli_quality;
  int m_deflate_level;
  int m_zstd_level;
  std::vector<std::string> m_function_schemas;
};

class global_settings final {

public:
  global_settings() = delete;

  static void set_configuration(std::unique_ptr<global_settings_base> && b) { settings = std::move(b); }

  // Reject a catalog function whose name collides with an earlier one instead of replacing it
  static bool get_strict_function_names() { return settings->get_strict_function_names(); }

  // Brotli quality used when recompressing tiles (0-11)
  static int get_brotli_quality() { return settings->get_brotli_quality(); }

  // zlib level used when recompressing tiles as gzip or deflate (1-9)
  static int get_deflate_level() { return settings->get_deflate_level(); }

  // zstd level used when recompressing tiles (1-22)
  static int get_zstd_level() { return settings->get_zstd_level(); }

  // Schemas searched for tile functions, empty means all
  static std::vector<std::string> get_function_schemas() { return settings->get_function_schemas(); }

private:
  static std::unique_ptr<global_settings_base> settings;  // gets initialized with global_settings_default instance
};

/**
 * Describes the command line / config file options understood by
 * global_settings_via_options, for the embedding server to add to its own.
 */
po::options_description tile_options_description();

#endif

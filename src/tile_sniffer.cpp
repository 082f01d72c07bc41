/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include "tilecore/tile_sniffer.hpp"
#include "tilecore/codec.hpp"
#include "tilecore/logger.hpp"

#include <array>
#include <exception>
#include <string>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace tile {

namespace {

constexpr std::array<unsigned char, 8> PNG_MAGIC  = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::array<unsigned char, 3> JPEG_MAGIC = {0xFF, 0xD8, 0xFF};
constexpr std::array<unsigned char, 4> GIF_MAGIC  = {0x47, 0x49, 0x46, 0x38};
constexpr std::array<unsigned char, 4> RIFF_MAGIC = {'R', 'I', 'F', 'F'};
constexpr std::array<unsigned char, 4> WEBP_MAGIC = {'W', 'E', 'B', 'P'};
constexpr std::array<unsigned char, 2> GZIP_MAGIC = {0x1F, 0x8B};
constexpr std::array<unsigned char, 4> ZSTD_MAGIC = {0x28, 0xB5, 0x2F, 0xFD};

template <std::size_t N>
bool has_magic_at(std::string_view data, std::size_t offset,
                  const std::array<unsigned char, N> &magic) {
  if (data.size() < offset + N)
    return false;

  for (std::size_t i = 0; i < N; ++i) {
    if (static_cast<unsigned char>(data[offset + i]) != magic[i])
      return false;
  }
  return true;
}

template <std::size_t N>
bool starts_with(std::string_view data, const std::array<unsigned char, N> &magic) {
  return has_magic_at(data, 0, magic);
}

bool is_zlib(std::string_view data) {
  if (data.size() < 2 || static_cast<unsigned char>(data[0]) != 0x78)
    return false;

  auto level = static_cast<unsigned char>(data[1]);
  return level == 0x01 || level == 0x9C || level == 0xDA;
}

std::optional<encoding> compression_of(std::string_view data) {
  if (starts_with(data, GZIP_MAGIC))
    return encoding::gzip;
  if (is_zlib(data))
    return encoding::zlib;
  if (starts_with(data, ZSTD_MAGIC))
    return encoding::zstd;
  return {};
}

// format checks on an uncompressed payload
format format_of(std::string_view data) {

  if (starts_with(data, PNG_MAGIC))
    return format::png;

  if (starts_with(data, JPEG_MAGIC))
    return format::jpeg;

  if (starts_with(data, GIF_MAGIC))
    return format::gif;

  // RIFF, 4 bytes of chunk size, WEBP
  if (starts_with(data, RIFF_MAGIC) && has_magic_at(data, 8, WEBP_MAGIC))
    return format::webp;

  auto pos = data.find_first_not_of(" \t\n\r");
  if (pos != std::string_view::npos && (data[pos] == '{' || data[pos] == '['))
    return format::json;

  return format::unknown;
}

} // anonymous namespace

info classify(std::string_view data) noexcept {

  info result;

  if (data.empty())
    return result;

  auto compression = compression_of(data);
  if (!compression) {
    result.fmt = format_of(data);
    return result;
  }

  result.enc = *compression;

  // without the codec the magic can't be verified, but it is the best
  // guess there is
  if (!is_supported(*compression))
    return result;

  try {
    result.fmt = format_of(decompress(data, *compression));
  } catch (const std::exception &) {
    // corrupt or truncated stream, the format stays unknown
    result.fmt = format::unknown;
  }

  return result;
}

info classify(std::string_view data, format fallback) noexcept {
  auto result = classify(data);
  if (result.fmt == format::unknown)
    result.fmt = fallback;
  return result;
}

std::optional<info> reconcile_format(std::string_view source,
                                     std::optional<info> detected,
                                     std::optional<format> declared) {

  if (!declared)
    return detected;

  if (!detected) {
    if (is_detectable(*declared)) {
      logger::warning(fmt::format("Source {} declares detectable tile format '{}', "
                                  "but it could not be verified", source, to_string(*declared)));
    } else {
      logger::message(fmt::format("Using tile format '{}' declared by source {}",
                                  to_string(*declared), source));
    }
    return info{*declared, encoding::uncompressed};
  }

  if (detected->fmt == *declared) {
    logger::message(fmt::format("Detected tile format {} of source {} matches its declared format",
                                fmt::streamed(*detected), source));
  } else {
    logger::warning(fmt::format("Source {} declares tile format '{}', but tiles were detected as {}. "
                                "Tiles will be served as {}.", source, to_string(*declared),
                                fmt::streamed(*detected), fmt::streamed(*detected)));
  }
  return detected;
}

} // namespace tile

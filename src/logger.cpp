/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <unistd.h>
#include <memory>

#include "tilecore/logger.hpp"

namespace logger {

namespace {

std::unique_ptr<std::ostream> stream;
std::mutex stream_mutex;
pid_t pid;

void write_line(std::string_view prefix, std::string_view m) {
  std::lock_guard<std::mutex> lock(stream_mutex);
  if (stream) {
    time_t now = time(nullptr);
    *stream << "[" << std::put_time( std::gmtime( &now ), "%FT%T") << " #" << pid << "] "
            << prefix << m << std::endl;
  }
}

} // anonymous namespace

void initialise(const std::string &filename) {
  std::lock_guard<std::mutex> lock(stream_mutex);
  stream = std::make_unique<std::ofstream>(filename, std::ios_base::out | std::ios_base::app);
  pid = getpid();
}

void message(std::string_view m) {
  write_line("", m);
}

void warning(std::string_view m) {
  write_line("WARNING: ", m);
}

}

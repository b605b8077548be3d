/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <ciso646>
#include <fstream>
#include <iterator>

#include <fmt/core.h>
#include <boost/filesystem.hpp>
#include "common/result.hpp"
#include "logger/logger.hpp"

teller::expected::Result<void, std::string> teller::ensure_directory(
    const boost::filesystem::path &dir, const logger::LoggerPtr &log) {
  if (dir.empty()) {
    return expected::makeValue();
  }

  boost::system::error_code error_code;
  bool is_dir = boost::filesystem::is_directory(dir, error_code);
  if (is_dir) {
    return expected::makeValue();
  }

  boost::filesystem::create_directories(dir, error_code);
  if (error_code != boost::system::errc::success) {
    return expected::makeError(fmt::format(
        "Cannot create directory '{}': {}", dir.string(), error_code.message()));
  }
  log->info("Created directory '{}'", dir.string());
  return expected::makeValue();
}

teller::expected::Result<std::string, std::string> teller::readTextFile(
    const boost::filesystem::path &path) {
  std::ifstream file(path.string(), std::ios_base::in);
  if (!file) {
    return expected::makeError(
        fmt::format("File '{}' could not be read.", path.string()));
  }

  std::string contents((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  return expected::makeValue(std::move(contents));
}

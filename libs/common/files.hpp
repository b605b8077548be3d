/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_FILES_HPP
#define TELLER_FILES_HPP

#include <string>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"
#include "logger/logger_fwd.hpp"

/**
 * This source file contains common methods related to files
 */
namespace teller {

  /**
   * Create a directory together with all missing parents. An already
   * existing directory is not an error.
   * @param dir - target folder
   * @param log - a log for local messages
   * @return error message on failure
   */
  teller::expected::Result<void, std::string> ensure_directory(
      const boost::filesystem::path &dir, const logger::LoggerPtr &log);

  /**
   * Read file in text mode, and either return its contents as a string
   * or return the error as a string
   * @param path - path to the file
   */
  teller::expected::Result<std::string, std::string> readTextFile(
      const boost::filesystem::path &path);

}  // namespace teller
#endif  // TELLER_FILES_HPP

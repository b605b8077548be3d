/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_CSV_TABLE_HPP
#define TELLER_CSV_TABLE_HPP

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include "logger/logger_fwd.hpp"
#include "storage/storage_error.hpp"

namespace teller {
  namespace storage {

    /**
     * A comma separated text file with a fixed header row. Fields containing
     * a separator, a quote, a backslash or a line break are quoted, and
     * quotes, backslashes and line breaks are escaped with a backslash, so
     * one physical line always holds one row.
     */
    class CsvTable {
     public:
      using Row = std::vector<std::string>;

      /// A parsed row with its line number in the file, counting from 1
      struct Record {
        size_t line;
        Row fields;
      };

      static const std::string kTempFileExtension;

      CsvTable(boost::filesystem::path path, Row header, logger::LoggerPtr log);

      const boost::filesystem::path &path() const;

      const Row &header() const;

      /// @return true if the file is missing or has zero size
      StorageResult<bool> isEmpty() const;

      /**
       * Write the header to a missing or empty file. A non-empty file is
       * only checked to start with the expected header.
       * @return true if the file has been created or filled with the header
       */
      StorageResult<bool> initialize();

      /**
       * Read all data rows. The header must match, and every row must have
       * as many fields as the header. Blank lines are skipped.
       */
      StorageResult<std::vector<Record>> readRows() const;

      /**
       * Replace the whole file: the rows are written to a temporary file
       * which is flushed, synced and renamed over the table.
       */
      StorageResult<void> writeRows(const std::vector<Row> &rows);

      /**
       * Append one row to the end of the file, writing the header first if
       * the file is missing or empty.
       */
      StorageResult<void> appendRow(const Row &row);

      /// Serialize a row to one line, without the line break.
      static std::string formatRow(const Row &row);

      /// Split one line into fields.
      static expected::Result<Row, std::string> parseLine(
          const std::string &line);

     private:
      StorageError makeError(std::string message) const;

      boost::filesystem::path path_;
      Row header_;
      logger::LoggerPtr log_;
    };

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_CSV_TABLE_HPP

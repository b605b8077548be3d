/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/csv_table.hpp"

#include <unistd.h>

#include <ciso646>
#include <sstream>

#include <fmt/format.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/tokenizer.hpp>
#include "common/files.hpp"
#include "logger/logger.hpp"

using teller::storage::CsvTable;
using teller::storage::StorageError;
using teller::storage::StorageResult;

namespace {
  const char kSeparator = ',';
  const char kQuote = '"';
  const char kEscape = '\\';
  const char kLineBreak = '\n';

  using Separator = boost::escaped_list_separator<char>;
  using Tokenizer = boost::tokenizer<Separator>;

  std::string quoteField(const std::string &field) {
    if (field.find_first_of(",\"\\\n") == std::string::npos) {
      return field;
    }
    std::string result;
    result.reserve(field.size() + 2);
    result.push_back(kQuote);
    for (char c : field) {
      if (c == kQuote or c == kEscape) {
        result.push_back(kEscape);
        result.push_back(c);
      } else if (c == kLineBreak) {
        result.push_back(kEscape);
        result.push_back('n');
      } else {
        result.push_back(c);
      }
    }
    result.push_back(kQuote);
    return result;
  }

  /// Write the text, then flush and sync the file to the disk.
  bool writeAndSync(
      boost::iostreams::stream<boost::iostreams::file_descriptor_sink> &file,
      const std::string &text) {
    if (not file.write(text.data(), text.size())) {
      return false;
    }
    if (not file.flush()) {
      return false;
    }
    return fsync(file->handle()) == 0;
  }
}  // namespace

const std::string CsvTable::kTempFileExtension = ".tmp";

CsvTable::CsvTable(boost::filesystem::path path,
                   Row header,
                   logger::LoggerPtr log)
    : path_(std::move(path)), header_(std::move(header)), log_(std::move(log)) {}

const boost::filesystem::path &CsvTable::path() const {
  return path_;
}

const CsvTable::Row &CsvTable::header() const {
  return header_;
}

StorageResult<bool> CsvTable::initialize() {
  auto empty = isEmpty();
  if (expected::hasError(empty)) {
    return expected::makeError(std::move(empty).assumeError());
  }
  if (empty.assumeValue()) {
    if (auto e = expected::resultToOptionalError(writeRows({}))) {
      return expected::makeError(std::move(e).value());
    }
    log_->info("created table {}", path_.string());
    return expected::makeValue(true);
  }

  // an existing table is only checked, never rewritten
  auto rows = readRows();
  if (expected::hasError(rows)) {
    return expected::makeError(std::move(rows).assumeError());
  }
  log_->debug("table {} already holds {} rows",
              path_.string(),
              rows.assumeValue().size());
  return expected::makeValue(false);
}

StorageResult<std::vector<CsvTable::Record>> CsvTable::readRows() const {
  auto contents = readTextFile(path_);
  if (expected::hasError(contents)) {
    return expected::makeError(makeError(contents.assumeError()));
  }

  std::istringstream stream(contents.assumeValue());
  std::vector<Record> records;
  bool header_seen = false;
  size_t line_number = 0;
  std::string line;
  while (std::getline(stream, line)) {
    ++line_number;
    if (not line.empty() and line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    auto fields = parseLine(line);
    if (expected::hasError(fields)) {
      return expected::makeError(makeError(fmt::format(
          "line {}: {}", line_number, fields.assumeError())));
    }

    if (not header_seen) {
      if (fields.assumeValue() != header_) {
        return expected::makeError(makeError(
            fmt::format("line {}: unexpected header `{}', expected `{}'",
                        line_number,
                        line,
                        formatRow(header_))));
      }
      header_seen = true;
      continue;
    }

    if (fields.assumeValue().size() != header_.size()) {
      return expected::makeError(makeError(
          fmt::format("line {}: expected {} fields, got {}",
                      line_number,
                      header_.size(),
                      fields.assumeValue().size())));
    }
    records.push_back(Record{line_number, std::move(fields).assumeValue()});
  }

  if (not header_seen) {
    return expected::makeError(makeError("header row is missing"));
  }
  return expected::makeValue(std::move(records));
}

StorageResult<void> CsvTable::writeRows(const std::vector<Row> &rows) {
  const auto tmp_path = boost::filesystem::path{path_.string()
                                                + kTempFileExtension};

  std::string text = formatRow(header_) + kLineBreak;
  for (const auto &row : rows) {
    text.append(formatRow(row)).push_back(kLineBreak);
  }

  boost::iostreams::stream<boost::iostreams::file_descriptor_sink> file;
  try {
    file.open(tmp_path, std::ios_base::out | std::ios_base::trunc);
  } catch (std::ios_base::failure const &e) {
    return expected::makeError(makeError(fmt::format(
        "cannot open {} for writing: {}", tmp_path.string(), e.what())));
  }
  if (not file.is_open()) {
    return expected::makeError(makeError(
        fmt::format("cannot open {} for writing", tmp_path.string())));
  }
  if (not writeAndSync(file, text)) {
    file->close();
    boost::system::error_code ignored;
    boost::filesystem::remove(tmp_path, ignored);
    return expected::makeError(makeError(
        fmt::format("cannot write {}", tmp_path.string())));
  }
  file->close();

  boost::system::error_code error_code;
  boost::filesystem::rename(tmp_path, path_, error_code);
  if (error_code != boost::system::errc::success) {
    return expected::makeError(makeError(fmt::format(
        "cannot replace the table: {}", error_code.message())));
  }
  log_->debug("wrote {} rows to {}", rows.size(), path_.string());
  return expected::makeValue();
}

StorageResult<void> CsvTable::appendRow(const Row &row) {
  auto empty = isEmpty();
  if (expected::hasError(empty)) {
    return expected::makeError(std::move(empty).assumeError());
  }

  std::string text;
  if (empty.assumeValue()) {
    text.append(formatRow(header_)).push_back(kLineBreak);
  }
  text.append(formatRow(row)).push_back(kLineBreak);

  boost::iostreams::stream<boost::iostreams::file_descriptor_sink> file;
  try {
    file.open(path_.string(), std::ios_base::out | std::ios_base::app);
  } catch (std::ios_base::failure const &e) {
    return expected::makeError(
        makeError(fmt::format("cannot open for appending: {}", e.what())));
  }
  if (not file.is_open()) {
    return expected::makeError(makeError("cannot open for appending"));
  }
  if (not writeAndSync(file, text)) {
    file->close();
    return expected::makeError(makeError("cannot append a row"));
  }
  file->close();
  return expected::makeValue();
}

std::string CsvTable::formatRow(const Row &row) {
  std::vector<std::string> quoted;
  quoted.reserve(row.size());
  for (const auto &field : row) {
    quoted.push_back(quoteField(field));
  }
  return boost::algorithm::join(quoted, std::string(1, kSeparator));
}

teller::expected::Result<CsvTable::Row, std::string> CsvTable::parseLine(
    const std::string &line) {
  try {
    Tokenizer tokenizer(line, Separator(kEscape, kSeparator, kQuote));
    return expected::makeValue(Row(tokenizer.begin(), tokenizer.end()));
  } catch (boost::escaped_list_error const &e) {
    return expected::makeError(std::string{e.what()});
  }
}

StorageError CsvTable::makeError(std::string message) const {
  return StorageError{path_.string(), std::move(message)};
}

StorageResult<bool> CsvTable::isEmpty() const {
  boost::system::error_code error_code;
  auto status = boost::filesystem::status(path_, error_code);
  if (status.type() == boost::filesystem::file_not_found) {
    return expected::makeValue(true);
  }
  if (error_code) {
    return expected::makeError(makeError(error_code.message()));
  }
  if (not boost::filesystem::is_regular_file(status)) {
    return expected::makeError(makeError("not a regular file"));
  }
  auto size = boost::filesystem::file_size(path_, error_code);
  if (error_code) {
    return expected::makeError(makeError(error_code.message()));
  }
  return expected::makeValue(size == 0);
}

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/csv_table.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "common/files.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"

using teller::storage::CsvTable;

class CsvTableTest : public ::testing::Test {
 protected:
  void SetUp() override {
    boost::filesystem::create_directory(test_dir);
  }

  void TearDown() override {
    boost::filesystem::remove_all(test_dir);
  }

  void writeFile(const std::string &text) {
    std::ofstream out(table_path.string(), std::ios::trunc);
    out << text;
  }

  std::string readFile() {
    return teller::readTextFile(table_path).assumeValue();
  }

  const boost::filesystem::path test_dir =
      boost::filesystem::temp_directory_path()
      / boost::filesystem::unique_path();
  const boost::filesystem::path table_path = test_dir / "table.csv";
  CsvTable table{table_path, {"id", "name"}, getTestLogger("CsvTable")};
};

/**
 * @given a missing file
 * @when the table is initialized twice
 * @then the first call writes the header and reports creation, the second
 * leaves the file as is
 */
TEST_F(CsvTableTest, InitializeIsIdempotent) {
  auto first = table.initialize();
  TELLER_ASSERT_RESULT_VALUE(first);
  EXPECT_TRUE(first.assumeValue());
  EXPECT_EQ(readFile(), "id,name\n");

  TELLER_ASSERT_RESULT_VALUE(table.appendRow({"1", "one"}));
  auto second = table.initialize();
  TELLER_ASSERT_RESULT_VALUE(second);
  EXPECT_FALSE(second.assumeValue());
  EXPECT_EQ(readFile(), "id,name\n1,one\n");
}

/**
 * @given an empty existing file
 * @when the table is initialized
 * @then the header is written
 */
TEST_F(CsvTableTest, InitializeEmptyFile) {
  writeFile("");
  auto result = table.initialize();
  TELLER_ASSERT_RESULT_VALUE(result);
  EXPECT_TRUE(result.assumeValue());
  EXPECT_EQ(readFile(), "id,name\n");
}

/**
 * @given rows with separators, quotes, backslashes and line breaks
 * @when they are written and read back
 * @then every field is restored and each row takes one line
 */
TEST_F(CsvTableTest, QuotedFieldsRoundTrip) {
  const std::vector<CsvTable::Row> rows{
      {"1", "123 Main St, Karachi"},
      {"2", "say \"hi\""},
      {"3", "back\\slash"},
      {"4", "two\nlines"},
      {"5", ""}};
  TELLER_ASSERT_RESULT_VALUE(table.writeRows(rows));

  auto read = table.readRows();
  TELLER_ASSERT_RESULT_VALUE(read);
  ASSERT_EQ(read.assumeValue().size(), rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    EXPECT_EQ(read.assumeValue()[i].fields, rows[i]);
    EXPECT_EQ(read.assumeValue()[i].line, i + 2);
  }
  EXPECT_FALSE(boost::filesystem::exists(table_path.string()
                                         + CsvTable::kTempFileExtension));
}

/**
 * @given a field with a comma
 * @when the row is formatted
 * @then the field is quoted and the others are not
 */
TEST_F(CsvTableTest, FormatRow) {
  EXPECT_EQ(CsvTable::formatRow({"987654321", "Main St, Karachi"}),
            "987654321,\"Main St, Karachi\"");
  EXPECT_EQ(CsvTable::formatRow({"a\"b"}), "\"a\\\"b\"");
}

/**
 * @given a table file with blank lines and CRLF line ends
 * @when it is read
 * @then blank lines are skipped and line numbers are kept
 */
TEST_F(CsvTableTest, SkipsBlankLines) {
  writeFile("id,name\r\n\r\n1,one\r\n\n2,two\n");
  auto read = table.readRows();
  TELLER_ASSERT_RESULT_VALUE(read);
  ASSERT_EQ(read.assumeValue().size(), 2u);
  EXPECT_EQ(read.assumeValue()[0].line, 3u);
  EXPECT_EQ(read.assumeValue()[1].fields, (CsvTable::Row{"2", "two"}));
}

/**
 * @given a table with a different header
 * @when it is read or initialized
 * @then an error naming the file is returned and the file is not touched
 */
TEST_F(CsvTableTest, WrongHeader) {
  writeFile("id,title\n1,one\n");
  auto read = table.readRows();
  TELLER_ASSERT_RESULT_ERROR(read);
  EXPECT_EQ(read.assumeError().path, table_path.string());
  TELLER_ASSERT_RESULT_ERROR(table.initialize());
  EXPECT_EQ(readFile(), "id,title\n1,one\n");
}

/**
 * @given a row with a wrong number of fields
 * @when the table is read
 * @then the error names the line
 */
TEST_F(CsvTableTest, WrongFieldCount) {
  writeFile("id,name\n1,one\n2\n");
  auto read = table.readRows();
  TELLER_ASSERT_RESULT_ERROR(read);
  EXPECT_NE(read.assumeError().message.find("line 3"), std::string::npos);
}

/**
 * @given lines with an unknown escape and a dangling backslash
 * @when they are parsed
 * @then errors are returned instead of exceptions
 */
TEST_F(CsvTableTest, MalformedEscape) {
  TELLER_ASSERT_RESULT_ERROR(CsvTable::parseLine("1,bad\\q"));
  TELLER_ASSERT_RESULT_ERROR(CsvTable::parseLine("1,bad\\"));
}

/**
 * @given a missing file
 * @when a row is appended
 * @then the header is written before the row
 */
TEST_F(CsvTableTest, AppendToMissingFile) {
  TELLER_ASSERT_RESULT_VALUE(table.appendRow({"1", "a,b"}));
  EXPECT_EQ(readFile(), "id,name\n1,\"a,b\"\n");
}

/**
 * @given a table path inside a missing directory
 * @when rows are written
 * @then an error is returned
 */
TEST_F(CsvTableTest, WriteToMissingDirectory) {
  CsvTable orphan{
      test_dir / "missing" / "table.csv", {"id"}, getTestLogger("CsvTable")};
  TELLER_ASSERT_RESULT_ERROR(orphan.writeRows({{"1"}}));
}

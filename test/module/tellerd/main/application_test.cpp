/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/application.hpp"

#include <fstream>
#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"
#include "service/account_service.hpp"
#include "storage/record_store.hpp"

using ::testing::HasSubstr;

class ApplicationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    boost::filesystem::create_directories(test_dir);
    config.accounts_path = (test_dir / "users.csv").string();
    config.transactions_path = (test_dir / "transactions.csv").string();
  }

  void TearDown() override {
    boost::filesystem::remove_all(test_dir);
  }

  std::unique_ptr<Application> makeApplication() {
    return std::make_unique<Application>(config, getTestLoggerManager());
  }

  const boost::filesystem::path test_dir =
      boost::filesystem::temp_directory_path()
      / boost::filesystem::unique_path();
  TellerConfig config;
};

/**
 * @given an empty directory and no configured seed accounts
 * @when the application is initialized
 * @then both tables exist and the demonstration accounts can log in
 */
TEST_F(ApplicationTest, SeedsDemoAccounts) {
  auto application = makeApplication();
  TELLER_ASSERT_RESULT_VALUE(application->init());

  EXPECT_TRUE(boost::filesystem::exists(config.accounts_path));
  EXPECT_TRUE(boost::filesystem::exists(config.transactions_path));

  auto accounts = application->recordStore()->loadAccounts();
  TELLER_ASSERT_RESULT_VALUE(accounts);
  ASSERT_EQ(accounts.assumeValue().size(), 2u);
  EXPECT_EQ(accounts.assumeValue()[0].accountNumber(), "987654321");
  EXPECT_EQ(accounts.assumeValue()[0].name(), "Saqlain Rai");
  EXPECT_EQ(accounts.assumeValue()[1].accountNumber(), "123456789");

  auto service = application->accountService();
  TELLER_ASSERT_RESULT_VALUE(service->authenticate("987654321", "1234"));
  TELLER_ASSERT_RESULT_VALUE(service->authenticate("123456789", "5678"));
}

/**
 * @given an initialized application with a changed balance
 * @when another application is initialized on the same tables
 * @then the accounts are not seeded again
 */
TEST_F(ApplicationTest, ExistingTablesAreKept) {
  {
    auto application = makeApplication();
    TELLER_ASSERT_RESULT_VALUE(application->init());
    auto service = application->accountService();
    auto account = service->authenticate("987654321", "1234");
    TELLER_ASSERT_RESULT_VALUE(account);
    TELLER_ASSERT_RESULT_VALUE(
        service->deposit(account.assumeValue(), "40"));
  }

  auto application = makeApplication();
  TELLER_ASSERT_RESULT_VALUE(application->init());
  auto account =
      application->accountService()->authenticate("987654321", "1234");
  TELLER_ASSERT_RESULT_VALUE(account);
  EXPECT_EQ(account.assumeValue().balance().toStringRepr(), "40.00");
  EXPECT_EQ(application->recordStore()->loadAccounts().assumeValue().size(),
            2u);
}

/**
 * @given configured seed accounts
 * @when the application is initialized
 * @then only they are written, with two decimal balances
 */
TEST_F(ApplicationTest, SeedsConfiguredAccounts) {
  config.seed_accounts = std::vector<TellerConfig::SeedAccount>{
      {"111222333",
       "Sara",
       "03ac674216f3e15c761ee1a5e255f067953623c8b388b4459e13f978d7c846f4",
       "7 Canal Rd, Lahore",
       "12.5"}};
  auto application = makeApplication();
  TELLER_ASSERT_RESULT_VALUE(application->init());

  auto accounts = application->recordStore()->loadAccounts().assumeValue();
  ASSERT_EQ(accounts.size(), 1u);
  EXPECT_EQ(accounts[0].balance().toStringRepr(), "12.50");
  TELLER_ASSERT_RESULT_VALUE(
      application->accountService()->authenticate("111222333", "1234"));
}

/**
 * @given a table path below a regular file
 * @when the application is initialized
 * @then the initialization fails
 */
TEST_F(ApplicationTest, UnusableStorage) {
  auto blocker = test_dir / "blocker";
  std::ofstream(blocker.string()) << "not a directory";
  config.accounts_path = (blocker / "users.csv").string();

  auto application = makeApplication();
  TELLER_ASSERT_RESULT_ERROR(application->init());
}

/**
 * @given an initialized application
 * @when a session is run on scripted input
 * @then the shell serves the demonstration account
 */
TEST_F(ApplicationTest, RunsSession) {
  auto application = makeApplication();
  TELLER_ASSERT_RESULT_VALUE(application->init());

  std::istringstream in("987654321\n1234\n1\n8\n");
  std::ostringstream out;
  application->run(in, out);
  EXPECT_THAT(out.str(), HasSubstr("Login successful!"));
  EXPECT_THAT(out.str(), HasSubstr("Current balance: 0.00"));
  EXPECT_THAT(out.str(), HasSubstr("Thank you for using ATM!"));
}

/**
 * @given an application which was not initialized
 * @when a session is run
 * @then nothing is printed
 */
TEST_F(ApplicationTest, RunWithoutInit) {
  auto application = makeApplication();
  std::istringstream in("987654321\n1234\n8\n");
  std::ostringstream out;
  application->run(in, out);
  EXPECT_TRUE(out.str().empty());
}

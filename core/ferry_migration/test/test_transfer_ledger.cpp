// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TransferLedger
 */

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "test_helpers.hpp"
#include "transfer_ledger.hpp"

using namespace ferry::migration;

class TransferLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = test::createTempDir("ferry_ledger_");
    db_path_ = dir_ + "/ledger.db";
    ledger_ = std::make_unique<TransferLedger>(db_path_);
  }

  void TearDown() override {
    ledger_.reset();
    test::removeTempDir(dir_);
  }

  std::string dir_;
  std::string db_path_;
  std::unique_ptr<TransferLedger> ledger_;
};

TEST_F(TransferLedgerTest, FirstAttemptCreatesRecord) {
  ASSERT_TRUE(ledger_->recordAttempt("a", "x", 42, "single_part"));

  auto record = ledger_->get("a", "x");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->size_bytes, 42u);
  EXPECT_EQ(record->strategy, "single_part");
  EXPECT_EQ(record->status, TransferStatus::TRANSFERRING);
  EXPECT_EQ(record->attempts, 1);
  EXPECT_FALSE(record->created_at.empty());
  EXPECT_TRUE(record->completed_at.empty());
}

TEST_F(TransferLedgerTest, RepeatedAttemptsAreCounted) {
  ASSERT_TRUE(ledger_->recordAttempt("a", "x", 42, "single_part"));
  ASSERT_TRUE(ledger_->markFailed("a", "x", "PutObject failed"));
  ASSERT_TRUE(ledger_->recordAttempt("a", "x", 42, "single_part"));

  auto record = ledger_->get("a", "x");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->attempts, 2);
  EXPECT_EQ(record->status, TransferStatus::TRANSFERRING);
}

TEST_F(TransferLedgerTest, CompletionAndFailureAreRecorded) {
  ledger_->recordAttempt("a", "x", 1, "single_part");
  ledger_->recordAttempt("a", "y", 8 * 1024 * 1024, "chunked");
  ASSERT_TRUE(ledger_->markCompleted("a", "x"));
  ASSERT_TRUE(ledger_->markFailed("a", "y", "part 2: boom"));

  EXPECT_EQ(ledger_->countByStatus(TransferStatus::COMPLETED), 1u);
  EXPECT_EQ(ledger_->countByStatus(TransferStatus::FAILED), 1u);
  EXPECT_EQ(ledger_->countByStatus(TransferStatus::TRANSFERRING), 0u);

  auto failed = ledger_->getFailed();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].object_key, "y");
  EXPECT_EQ(failed[0].last_error, "part 2: boom");

  EXPECT_FALSE(ledger_->get("a", "x")->completed_at.empty());
}

TEST_F(TransferLedgerTest, UpdatesOnUnknownObjectReturnFalse) {
  EXPECT_FALSE(ledger_->markCompleted("a", "missing"));
  EXPECT_FALSE(ledger_->markFailed("a", "missing", "err"));
  EXPECT_FALSE(ledger_->get("a", "missing").has_value());
}

TEST_F(TransferLedgerTest, SameKeyInDifferentBucketsIsDistinct) {
  ledger_->recordAttempt("a", "x", 1, "single_part");
  ledger_->recordAttempt("b", "x", 2, "single_part");
  ledger_->markCompleted("a", "x");

  EXPECT_EQ(ledger_->get("a", "x")->status, TransferStatus::COMPLETED);
  EXPECT_EQ(ledger_->get("b", "x")->status, TransferStatus::TRANSFERRING);
}

TEST_F(TransferLedgerTest, SessionsAreTrackedUntilClosed) {
  ledger_->onSessionOpened("a", "y", "upload-1");
  ledger_->onSessionOpened("a", "z", "upload-2");
  ledger_->onSessionClosed("upload-1");

  auto sessions = ledger_->getOpenSessions();
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].upload_id, "upload-2");
  EXPECT_EQ(sessions[0].bucket, "a");
  EXPECT_EQ(sessions[0].object_key, "z");
}

TEST_F(TransferLedgerTest, StateSurvivesReopen) {
  ledger_->recordAttempt("a", "x", 1, "single_part");
  ledger_->onSessionOpened("a", "y", "upload-9");
  ledger_.reset();

  TransferLedger reopened(db_path_);
  EXPECT_TRUE(reopened.get("a", "x").has_value());
  ASSERT_EQ(reopened.getOpenSessions().size(), 1u);
  EXPECT_EQ(reopened.path(), db_path_);
}

TEST(TransferLedgerOpenTest, UnopenablePathThrows) {
  EXPECT_THROW(TransferLedger ledger("/nonexistent/dir/ledger.db"), std::runtime_error);
}

TEST(TransferStatusTest, StringRoundTrip) {
  EXPECT_EQ(transferStatusToString(TransferStatus::TRANSFERRING), "transferring");
  EXPECT_EQ(transferStatusFromString("completed"), TransferStatus::COMPLETED);
  EXPECT_EQ(transferStatusFromString("garbage"), TransferStatus::PENDING);
}

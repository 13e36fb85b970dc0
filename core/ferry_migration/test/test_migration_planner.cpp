// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit and scenario tests for MigrationPlanner
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <new>
#include <set>

#include "in_memory_storage_client.hpp"
#include "migration_planner.hpp"
#include "storage_mocks.hpp"
#include "test_helpers.hpp"
#include "transfer_ledger.hpp"

using namespace ferry::migration;
using ferry::storage::CreateBucketOutcome;
using ferry::storage::ObjectPayload;
using ferry::storage::ObjectSummary;
using ferry::storage::StorageResult;
using ferry::storage::test::InMemoryStorageClient;
using ferry::storage::test::MockStorageClient;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

constexpr size_t kMiB = 1024 * 1024;

std::set<std::string> keysOf(const std::vector<ObjectSummary>& objects) {
  std::set<std::string> keys;
  for (const auto& object : objects) {
    keys.insert(object.key);
  }
  return keys;
}

// Source whose body read throws for one key, as an oversized reserve would
class ThrowingReadClient : public InMemoryStorageClient {
public:
  explicit ThrowingReadClient(std::string throwing_key)
      : throwing_key_(std::move(throwing_key)) {}

  StorageResult<ObjectPayload> getObject(const std::string& bucket, const std::string& key) override {
    if (key == throwing_key_) {
      throw std::bad_alloc();
    }
    return InMemoryStorageClient::getObject(bucket, key);
  }

private:
  std::string throwing_key_;
};

}  // namespace

class MigrationPlannerTest : public ::testing::Test {
protected:
  MigrationPlanner makePlanner(
    const MigrationOptions& options = {}, TransferLedger* ledger = nullptr
  ) {
    return MigrationPlanner(source_, destination_, options, {}, ledger);
  }

  InMemoryStorageClient source_;
  InMemoryStorageClient destination_;
};

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST_F(MigrationPlannerTest, PendingObjectIsChunkedIntoTwoParts) {
  source_.addObject("a", "x", 3 * kMiB);
  source_.addObject("a", "y", 8 * kMiB);
  destination_.addBucket("a");
  destination_.addObject("a", "x", 3 * kMiB);

  auto planner = makePlanner();
  auto summary = planner.run();

  ASSERT_EQ(summary.buckets.size(), 1u);
  const auto& report = summary.buckets[0];
  EXPECT_EQ(report.destination_bucket, "a");
  EXPECT_EQ(report.source_objects, 2u);
  EXPECT_EQ(report.already_migrated, 1u);
  EXPECT_EQ(report.pending, 1u);
  EXPECT_EQ(report.transferred, 1u);
  EXPECT_EQ(report.status, BucketStatus::COMPLETED);

  EXPECT_EQ(destination_.keys("a"), (std::set<std::string>{"x", "y"}));
  EXPECT_EQ(destination_.object("a", "y"), source_.object("a", "y"));
  EXPECT_EQ(destination_.uploadPartCalls(), 2);
  EXPECT_EQ(destination_.putCalls(), 0);
  EXPECT_EQ(planner.stats().chunked_transfers.load(), 1u);
  EXPECT_EQ(planner.stats().bytes_transferred.load(), 8u * kMiB);
  EXPECT_FALSE(summary.hasFailures());
}

TEST_F(MigrationPlannerTest, SecondRunTransfersNothing) {
  source_.addObject("a", "x", static_cast<size_t>(100));
  source_.addObject("a", "y", static_cast<size_t>(200));
  source_.addObject("b", "z", static_cast<size_t>(300));

  auto first = makePlanner();
  first.run();
  const int puts_after_first = destination_.putCalls();
  EXPECT_EQ(puts_after_first, 3);

  auto second = makePlanner();
  auto summary = second.run();

  EXPECT_EQ(destination_.putCalls(), puts_after_first);
  EXPECT_EQ(second.stats().objects_transferred.load(), 0u);
  EXPECT_EQ(second.stats().objects_skipped.load(), 3u);
  for (const auto& report : summary.buckets) {
    EXPECT_EQ(report.pending, 0u);
  }
}

TEST_F(MigrationPlannerTest, MissingDestinationBucketIsCreated) {
  source_.addObject("fresh", "k", static_cast<size_t>(10));

  auto planner = makePlanner();
  planner.run();

  EXPECT_TRUE(destination_.hasBucket("fresh"));
  EXPECT_EQ(destination_.keys("fresh"), (std::set<std::string>{"k"}));
}

TEST_F(MigrationPlannerTest, ObjectFailureDoesNotStopBucket) {
  source_.addObject("a", "k1", static_cast<size_t>(10));
  source_.addObject("a", "k2", static_cast<size_t>(10));
  source_.addObject("a", "k3", static_cast<size_t>(10));
  destination_.failPut("k2");

  auto planner = makePlanner();
  auto summary = planner.run();

  const auto& report = summary.buckets[0];
  EXPECT_EQ(report.status, BucketStatus::COMPLETED_WITH_FAILURES);
  EXPECT_EQ(report.failed_keys, std::vector<std::string>{"k2"});
  EXPECT_EQ(destination_.keys("a"), (std::set<std::string>{"k1", "k3"}));
  EXPECT_TRUE(summary.hasFailures());
}

TEST_F(MigrationPlannerTest, HaltOnObjectFailureSkipsRestOfBucket) {
  source_.addObject("a", "k1", static_cast<size_t>(10));
  source_.addObject("a", "k2", static_cast<size_t>(10));
  source_.addObject("a", "k3", static_cast<size_t>(10));
  destination_.failPut("k2");

  MigrationOptions options;
  options.continue_on_object_failure = false;
  auto planner = makePlanner(options);
  auto summary = planner.run();

  EXPECT_EQ(destination_.keys("a"), (std::set<std::string>{"k1"}));
  EXPECT_EQ(summary.buckets[0].status, BucketStatus::COMPLETED_WITH_FAILURES);
}

TEST_F(MigrationPlannerTest, StopRequestSkipsRemainingWork) {
  source_.addObject("a", "k1", static_cast<size_t>(10));
  source_.addObject("b", "k2", static_cast<size_t>(10));

  auto planner = makePlanner();
  planner.requestStop();
  auto summary = planner.run();

  EXPECT_TRUE(summary.stopped);
  EXPECT_TRUE(summary.buckets.empty());
  EXPECT_EQ(destination_.putCalls(), 0);
}

TEST_F(MigrationPlannerTest, OnlySelectedBucketsAreMigrated) {
  source_.addObject("a", "k1", static_cast<size_t>(10));
  source_.addObject("b", "k2", static_cast<size_t>(10));

  MigrationOptions options;
  options.only_buckets = {"b", "missing"};
  auto planner = makePlanner(options);
  auto summary = planner.run();

  ASSERT_EQ(summary.buckets.size(), 1u);
  EXPECT_EQ(summary.buckets[0].source_bucket, "b");
  EXPECT_FALSE(destination_.hasBucket("a"));
}

TEST_F(MigrationPlannerTest, SourceBucketListingFailureIsFatal) {
  source_.failListBuckets(true);
  auto planner = makePlanner();
  try {
    planner.run();
    FAIL() << "expected MigrationError";
  } catch (const MigrationError& e) {
    EXPECT_EQ(e.kind(), MigrationErrorKind::LISTING);
  }
}

TEST_F(MigrationPlannerTest, ObjectListingFailureFailsOnlyThatBucket) {
  source_.addObject("a", "k1", static_cast<size_t>(10));
  source_.addObject("b", "k2", static_cast<size_t>(10));
  source_.failListObjects("a");

  auto planner = makePlanner();
  auto summary = planner.run();

  ASSERT_EQ(summary.buckets.size(), 2u);
  EXPECT_EQ(summary.buckets[0].status, BucketStatus::FAILED);
  EXPECT_EQ(summary.buckets[1].status, BucketStatus::COMPLETED);
  EXPECT_EQ(destination_.keys("b"), (std::set<std::string>{"k2"}));
}

// ============================================================================
// Listing and pending set
// ============================================================================

TEST_F(MigrationPlannerTest, PaginatedDestinationGivesSamePendingSet) {
  for (int i = 0; i < 50; ++i) {
    source_.addObject("a", "key-" + std::to_string(100 + i), static_cast<size_t>(1));
  }
  destination_.addBucket("a");
  for (int i = 0; i < 50; i += 3) {
    destination_.addObject("a", "key-" + std::to_string(100 + i), static_cast<size_t>(1));
  }

  MigrationOptions single_page;
  single_page.page_size = 1000;
  MigrationOptions small_pages;
  small_pages.page_size = 7;

  auto planner_single = makePlanner(single_page);
  auto planner_paged = makePlanner(small_pages);

  auto source_objects = planner_single.listSourceObjects("a");
  auto pending_single =
    MigrationPlanner::computePending(source_objects, planner_single.listMigratedKeys("a"));
  auto pending_paged =
    MigrationPlanner::computePending(source_objects, planner_paged.listMigratedKeys("a"));

  EXPECT_EQ(keysOf(pending_single), keysOf(pending_paged));
  EXPECT_EQ(pending_single.size(), 33u);
}

TEST(ComputePendingTest, SetDifferenceKeepsSourceOrder) {
  std::vector<ObjectSummary> source = {{"c", 1}, {"a", 2}, {"b", 3}, {"d", 4}};
  std::unordered_set<std::string> migrated = {"a", "d", "zz"};

  auto pending = MigrationPlanner::computePending(source, migrated);
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].key, "c");
  EXPECT_EQ(pending[1].key, "b");
  EXPECT_EQ(pending[1].size_bytes, 3u);
}

TEST_F(MigrationPlannerTest, SourceListingStopsAtCap) {
  for (int i = 0; i < 25; ++i) {
    source_.addObject("a", "key-" + std::to_string(100 + i), static_cast<size_t>(1));
  }

  MigrationOptions options;
  options.max_source_keys = 10;
  options.page_size = 4;
  auto planner = makePlanner(options);

  bool truncated = false;
  auto objects = planner.listSourceObjects("a", &truncated);
  EXPECT_EQ(objects.size(), 10u);
  EXPECT_TRUE(truncated);

  auto summary = planner.run();
  EXPECT_TRUE(summary.buckets[0].listing_truncated);
  EXPECT_EQ(destination_.keys("a").size(), 10u);
}

TEST_F(MigrationPlannerTest, ListingExactlyAtCapIsNotTruncated) {
  for (int i = 0; i < 8; ++i) {
    source_.addObject("a", "key-" + std::to_string(i), static_cast<size_t>(1));
  }
  MigrationOptions options;
  options.max_source_keys = 8;
  options.page_size = 8;
  auto planner = makePlanner(options);

  bool truncated = true;
  EXPECT_EQ(planner.listSourceObjects("a", &truncated).size(), 8u);
  EXPECT_FALSE(truncated);
}

// ============================================================================
// Bucket name resolution
// ============================================================================

TEST_F(MigrationPlannerTest, TakenNameRetriesWithSuffixOnce) {
  source_.addObject("a", "k", static_cast<size_t>(10));
  destination_.addForeignBucket("a");

  MigrationOptions options;
  options.bucket_suffix = "-migrated";
  auto planner = makePlanner(options);
  auto summary = planner.run();

  EXPECT_EQ(destination_.createBucketAttempts(), (std::vector<std::string>{"a", "a-migrated"}));
  EXPECT_EQ(summary.buckets[0].destination_bucket, "a-migrated");
  EXPECT_EQ(destination_.keys("a-migrated"), (std::set<std::string>{"k"}));
}

TEST_F(MigrationPlannerTest, SuffixedNameTakenIsExhausted) {
  source_.addObject("a", "k", static_cast<size_t>(10));
  source_.addObject("b", "k", static_cast<size_t>(10));
  destination_.addForeignBucket("a");
  destination_.addForeignBucket("a-migrated");

  MigrationOptions options;
  options.bucket_suffix = "-migrated";
  auto planner = makePlanner(options);

  try {
    planner.run();
    FAIL() << "expected MigrationError";
  } catch (const MigrationError& e) {
    EXPECT_EQ(e.kind(), MigrationErrorKind::BUCKET_NAME_EXHAUSTED);
    EXPECT_EQ(e.bucket(), "a");
  }
  // Run halted: no attempt was made for bucket "b"
  EXPECT_EQ(destination_.createBucketAttempts(), (std::vector<std::string>{"a", "a-migrated"}));
}

TEST_F(MigrationPlannerTest, TakenNameWithoutSuffixIsFatal) {
  source_.addObject("a", "k", static_cast<size_t>(10));
  destination_.addForeignBucket("a");

  auto planner = makePlanner();
  try {
    planner.run();
    FAIL() << "expected MigrationError";
  } catch (const MigrationError& e) {
    EXPECT_EQ(e.kind(), MigrationErrorKind::NO_SUFFIX_CONFIGURED);
  }
  EXPECT_EQ(destination_.createBucketAttempts().size(), 1u);
}

TEST_F(MigrationPlannerTest, ConflictSkipsBucketWhenNotHalting) {
  source_.addObject("a", "k", static_cast<size_t>(10));
  source_.addObject("b", "k", static_cast<size_t>(10));
  destination_.addForeignBucket("a");

  MigrationOptions options;
  options.halt_on_bucket_conflict = false;
  auto planner = makePlanner(options);
  auto summary = planner.run();

  ASSERT_EQ(summary.buckets.size(), 2u);
  EXPECT_EQ(summary.buckets[0].status, BucketStatus::FAILED);
  EXPECT_EQ(summary.buckets[1].status, BucketStatus::COMPLETED);
  EXPECT_EQ(planner.stats().buckets_failed.load(), 1u);
}

TEST(MigrationPlannerResolveTest, OwnedByYouDoesNotTriggerSuffix) {
  StrictMock<MockStorageClient> source;
  StrictMock<MockStorageClient> destination;
  EXPECT_CALL(destination, createBucket("a"))
    .WillOnce(Return(StorageResult<CreateBucketOutcome>::Success(
      CreateBucketOutcome::ALREADY_OWNED_BY_YOU
    )));

  MigrationOptions options;
  options.bucket_suffix = "-new";
  MigrationPlanner planner(source, destination, options);
  EXPECT_EQ(planner.resolveDestinationBucket("a"), "a");
}

TEST(MigrationPlannerResolveTest, SuffixIsTriedExactlyOnce) {
  StrictMock<MockStorageClient> source;
  StrictMock<MockStorageClient> destination;
  ::testing::InSequence seq;
  EXPECT_CALL(destination, createBucket("a"))
    .WillOnce(Return(StorageResult<CreateBucketOutcome>::Success(CreateBucketOutcome::ALREADY_EXISTS)));
  EXPECT_CALL(destination, createBucket("a-new"))
    .WillOnce(Return(StorageResult<CreateBucketOutcome>::Success(CreateBucketOutcome::CREATED)));

  MigrationOptions options;
  options.bucket_suffix = "-new";
  MigrationPlanner planner(source, destination, options);
  EXPECT_EQ(planner.resolveDestinationBucket("a"), "a-new");
}

TEST(MigrationPlannerResolveTest, CreateErrorIsReported) {
  StrictMock<MockStorageClient> source;
  StrictMock<MockStorageClient> destination;
  EXPECT_CALL(destination, createBucket("a"))
    .WillOnce(Return(StorageResult<CreateBucketOutcome>::Failure("denied", "AccessDenied")));

  MigrationPlanner planner(source, destination, MigrationOptions{});
  try {
    planner.resolveDestinationBucket("a");
    FAIL() << "expected MigrationError";
  } catch (const MigrationError& e) {
    EXPECT_EQ(e.kind(), MigrationErrorKind::BUCKET_CREATE_FAILED);
  }
}

// ============================================================================
// Ledger integration
// ============================================================================

class MigrationPlannerLedgerTest : public MigrationPlannerTest {
protected:
  void SetUp() override {
    dir_ = test::createTempDir("ferry_planner_");
    ledger_ = std::make_unique<TransferLedger>(dir_ + "/ledger.db");
  }

  void TearDown() override {
    ledger_.reset();
    test::removeTempDir(dir_);
  }

  std::string dir_;
  std::unique_ptr<TransferLedger> ledger_;
};

TEST_F(MigrationPlannerLedgerTest, OutcomesAreRecorded) {
  source_.addObject("a", "ok", static_cast<size_t>(10));
  source_.addObject("a", "bad", static_cast<size_t>(10));
  destination_.failPut("bad");

  auto planner = makePlanner({}, ledger_.get());
  planner.run();

  EXPECT_EQ(ledger_->get("a", "ok")->status, TransferStatus::COMPLETED);
  EXPECT_EQ(ledger_->get("a", "bad")->status, TransferStatus::FAILED);
  EXPECT_TRUE(ledger_->getOpenSessions().empty());
}

TEST_F(MigrationPlannerLedgerTest, OrphanedSessionsAreAbortedBeforePlanning) {
  destination_.addBucket("a");
  const std::string orphan = destination_.openSession("a", "big");
  ledger_->onSessionOpened("a", "big", orphan);
  ledger_->onSessionOpened("a", "gone", "upload-unknown");

  auto planner = makePlanner({}, ledger_.get());
  auto summary = planner.run();

  EXPECT_EQ(summary.sessions_recovered, 2u);
  EXPECT_EQ(destination_.openSessionCount(), 0u);
  EXPECT_TRUE(ledger_->getOpenSessions().empty());
}

TEST_F(MigrationPlannerLedgerTest, SessionWhoseAbortFailsStaysRecorded) {
  destination_.addBucket("a");
  const std::string orphan = destination_.openSession("a", "big");
  ledger_->onSessionOpened("a", "big", orphan);
  destination_.failAbort("big");

  auto planner = makePlanner({}, ledger_.get());
  EXPECT_EQ(planner.recoverOrphanedSessions(), 0u);
  EXPECT_EQ(ledger_->getOpenSessions().size(), 1u);
}

TEST(MigrationPlannerIsolationTest, ThrowingReadFailsOnlyThatObject) {
  ThrowingReadClient source("huge");
  InMemoryStorageClient destination;
  source.addObject("a", "huge", static_cast<size_t>(10));
  source.addObject("a", "z", static_cast<size_t>(10));
  source.addObject("b", "w", static_cast<size_t>(10));

  const std::string dir = test::createTempDir("ferry_planner_");
  {
    TransferLedger ledger(dir + "/ledger.db");
    MigrationPlanner planner(source, destination, {}, {}, &ledger);

    MigrationSummary summary;
    ASSERT_NO_THROW(summary = planner.run());

    ASSERT_EQ(summary.buckets.size(), 2u);
    EXPECT_EQ(summary.buckets[0].status, BucketStatus::COMPLETED_WITH_FAILURES);
    EXPECT_EQ(summary.buckets[0].failed_keys, std::vector<std::string>{"huge"});
    EXPECT_EQ(destination.keys("a"), (std::set<std::string>{"z"}));
    EXPECT_EQ(destination.keys("b"), (std::set<std::string>{"w"}));
    EXPECT_EQ(planner.stats().objects_failed.load(), 1u);

    auto record = ledger.get("a", "huge");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, TransferStatus::FAILED);
  }
  test::removeTempDir(dir);
}

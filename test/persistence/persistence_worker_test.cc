#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <cstdio>
#include <functional>
#include <thread>
#include "../../src/persistence/persistence_worker.h"
#include "../../src/persistence/sqlite_round_store.h"
#include "../../src/common/errors.h"

using namespace Roundwatch;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {

class MockRoundStore : public RoundStore {
public:
    MOCK_METHOD(void, BeginBatch, (), (override));
    MOCK_METHOD(void, CommitBatch, (), (override));
    MOCK_METHOD(void, AbortBatch, (), (override));
    MOCK_METHOD(void, WriteGroup, (const std::string& source_id, const std::vector<RoundRecord>& records), (override));
    MOCK_METHOD(void, WriteOne, (const RoundRecord& record), (override));
    MOCK_METHOD(int64_t, CountRounds, (const std::string& source_id), (override));
    MOCK_METHOD(void, Close, (), (override));
};

RoundRecord MakeRecord(const std::string& source, double score = 1.8) {
    RoundRecord record;
    record.source_id = source;
    record.final_score = score;
    record.total_player_count = 100;
    record.snapshots.push_back(RoundSnapshot{1.2, 100, 50, 1700000000.0});
    record.earnings = Earnings{25, 2.35, 1000};
    record.timestamp = 1700000001.0;
    return record;
}

bool WaitFor(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return done();
}

} // namespace

class PersistenceWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue_ = std::make_shared<RecordQueue>(10000);
        path_ = ::testing::TempDir() + "roundwatch_worker_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db";
        RemoveFiles();
    }

    void TearDown() override {
        RemoveFiles();
    }

    void RemoveFiles() {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    std::shared_ptr<RecordQueue> queue_;
    std::string path_;
};

TEST_F(PersistenceWorkerTest, FullBatchFlushesOnceBeforeTimeout) {
    auto store = std::make_unique<NiceMock<MockRoundStore>>();
    std::atomic<int> begins{0};
    std::atomic<size_t> written{0};
    ON_CALL(*store, BeginBatch()).WillByDefault(Invoke([&] { begins++; }));
    ON_CALL(*store, WriteGroup(_, _)).WillByDefault(
        Invoke([&](const std::string&, const std::vector<RoundRecord>& records) { written += records.size(); }));

    PersistenceOptions options;
    options.batch_size = 50;
    options.batch_timeout = std::chrono::milliseconds(1000);
    PersistenceWorker worker(queue_, std::move(store), options);
    worker.Start();

    for (int i = 0; i < 50; i++) {
        ASSERT_TRUE(EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0)));
    }
    ASSERT_TRUE(WaitFor([&] { return worker.stats().total_batches == 1; }, std::chrono::milliseconds(500)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    PersistenceStats stats = worker.stats();
    EXPECT_EQ(stats.total_batches, 1u);
    EXPECT_EQ(stats.last_batch_size, 50u);
    EXPECT_EQ(stats.total_processed, 50u);
    EXPECT_EQ(begins.load(), 1);
    EXPECT_EQ(written.load(), 50u);
    worker.Stop();
}

TEST_F(PersistenceWorkerTest, SingleRecordFlushesAfterTimeout) {
    PersistenceOptions options;
    options.batch_size = 50;
    options.batch_timeout = std::chrono::milliseconds(150);
    PersistenceWorker worker(queue_, std::make_unique<NiceMock<MockRoundStore>>(), options);
    worker.Start();

    auto enqueued = std::chrono::steady_clock::now();
    ASSERT_TRUE(EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0)));
    ASSERT_TRUE(WaitFor([&] { return worker.stats().total_batches == 1; }, std::chrono::milliseconds(3000)));
    EXPECT_GE(std::chrono::steady_clock::now() - enqueued, options.batch_timeout);
    EXPECT_EQ(worker.stats().last_batch_size, 1u);
    worker.Stop();
}

TEST_F(PersistenceWorkerTest, GroupsBySourceInOneTransaction) {
    auto store = std::make_unique<NiceMock<MockRoundStore>>();
    EXPECT_CALL(*store, BeginBatch()).Times(1);
    EXPECT_CALL(*store, WriteGroup("bookmaker1", ::testing::SizeIs(2))).Times(1);
    EXPECT_CALL(*store, WriteGroup("bookmaker2", ::testing::SizeIs(1))).Times(1);
    EXPECT_CALL(*store, CommitBatch()).Times(1);
    EXPECT_CALL(*store, Close()).Times(1);

    PersistenceOptions options;
    options.batch_size = 3;
    PersistenceWorker worker(queue_, std::move(store), options);
    EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0));
    EnqueueRecord(queue_, MakeRecord("bookmaker2"), std::chrono::milliseconds(0));
    EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0));
    worker.Start();
    ASSERT_TRUE(WaitFor([&] { return worker.stats().total_batches == 1; }, std::chrono::milliseconds(2000)));
    worker.Stop();
}

TEST_F(PersistenceWorkerTest, FailedGroupIsRetriedRecordByRecord) {
    PersistenceOptions options;
    options.batch_size = 1000;
    options.batch_timeout = std::chrono::milliseconds(60000);
    {
        PersistenceWorker worker(queue_, std::make_unique<SqliteRoundStore>(path_), options);
        worker.Start();
        EnqueueRecord(queue_, MakeRecord("bookmaker1", 1.5), std::chrono::milliseconds(0));
        EnqueueRecord(queue_, MakeRecord("bookmaker1", 0.4), std::chrono::milliseconds(0));
        EnqueueRecord(queue_, MakeRecord("bookmaker1", 7.0), std::chrono::milliseconds(0));
        worker.Stop();

        PersistenceStats stats = worker.stats();
        EXPECT_EQ(stats.total_processed, 2u);
        EXPECT_EQ(stats.total_errors, 1u);
    }
    SqliteRoundStore store(path_);
    EXPECT_EQ(store.CountRounds("bookmaker1"), 2);
}

TEST_F(PersistenceWorkerTest, CommitFailureDropsTheBatch) {
    auto store = std::make_unique<NiceMock<MockRoundStore>>();
    EXPECT_CALL(*store, CommitBatch()).WillOnce(Throw(PersistenceError("disk I/O error")));
    EXPECT_CALL(*store, AbortBatch()).Times(1);

    PersistenceOptions options;
    options.batch_size = 2;
    PersistenceWorker worker(queue_, std::move(store), options);
    EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0));
    EnqueueRecord(queue_, MakeRecord("bookmaker2"), std::chrono::milliseconds(0));
    worker.Start();
    ASSERT_TRUE(WaitFor([&] { return worker.stats().total_batches == 1; }, std::chrono::milliseconds(2000)));
    worker.Stop();

    EXPECT_EQ(worker.stats().total_errors, 2u);
    EXPECT_EQ(worker.stats().total_processed, 0u);
}

TEST_F(PersistenceWorkerTest, StopPersistsEverythingEnqueued) {
    PersistenceOptions options;
    options.batch_size = 50;
    options.batch_timeout = std::chrono::milliseconds(60000);
    const char* sources[] = {"bookmaker1", "bookmaker2", "bookmaker3"};
    {
        PersistenceWorker worker(queue_, std::make_unique<SqliteRoundStore>(path_), options);
        worker.Start();
        for (int i = 0; i < 170; i++) {
            ASSERT_TRUE(EnqueueRecord(queue_, MakeRecord(sources[i % 3], 1.0 + i % 7), std::chrono::milliseconds(0)));
        }
        worker.Stop();
        EXPECT_EQ(worker.stats().total_processed, 170u);
        EXPECT_EQ(worker.stats().total_errors, 0u);
    }
    SqliteRoundStore store(path_);
    EXPECT_EQ(store.CountRounds(), 170);
    EXPECT_EQ(store.CountSnapshots(), 170);
}

TEST_F(PersistenceWorkerTest, TracksQueueDepth) {
    PersistenceOptions options;
    options.batch_size = 100;
    options.queue_warning_depth = 5;
    options.queue_critical_depth = 8;
    PersistenceWorker worker(queue_, std::make_unique<NiceMock<MockRoundStore>>(), options);
    for (int i = 0; i < 20; i++) {
        EnqueueRecord(queue_, MakeRecord("bookmaker1"), std::chrono::milliseconds(0));
    }
    worker.Start();
    ASSERT_TRUE(WaitFor([&] { return worker.stats().queue_warnings >= 1; }, std::chrono::milliseconds(2000)));
    worker.Stop();

    PersistenceStats stats = worker.stats();
    EXPECT_EQ(stats.total_processed, 20u);
    EXPECT_GE(stats.max_queue_size_seen, 5u);
    EXPECT_GE(stats.queue_warnings, 1u);
    EXPECT_GT(stats.average_batch_size(), 0);
}

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "common/utilities_test.hpp"
#include "facefind_core/db/database_manager.hpp"
#include "facefind_core/db/pooled_connection.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/db/transaction.hpp"

namespace facefind_core {

class ConnectionPoolTest : public facefind_tests::LocalStoreTestBase {};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  PooledConnection c1(*db_manager_);
  PooledConnection c2(*db_manager_);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Pool size is 4 in the fixture
  auto holder1 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder2 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder3 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder4 = std::make_unique<PooledConnection>(*db_manager_);

  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    PooledConnection c5(*db_manager_);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());

  holder1.reset();
  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, Shutdown_FurtherBorrowsReportAnOutage) {
  db_manager_->shutdown();

  try {
    PooledConnection conn(*db_manager_);
    FAIL() << "Expected LocalStoreError";
  } catch (const LocalStoreError& e) {
    EXPECT_EQ(e.kind(), DbErrorKind::CantOpen);
    EXPECT_TRUE(e.is_outage());
  }
}

TEST_F(ConnectionPoolTest, Transaction_RollsBackWhenNotCommitted) {
  PooledConnection conn(*db_manager_);
  {
    Transaction txn(*conn, /*immediate*/ true);
    *conn << "INSERT INTO folder_snapshots (owner, source_scope, fingerprint, file_count, "
             "processed_at) VALUES ('alice', 'f1', 'abc', 1, '2026-01-01 00:00:00')";
  }

  int count = -1;
  *conn << "SELECT COUNT(*) FROM folder_snapshots" >> count;
  EXPECT_EQ(count, 0);
}

TEST_F(ConnectionPoolTest, Transaction_CommitPersists) {
  PooledConnection conn(*db_manager_);
  {
    Transaction txn(*conn);
    *conn << "INSERT INTO folder_snapshots (owner, source_scope, fingerprint, file_count, "
             "processed_at) VALUES ('alice', 'f1', 'abc', 1, '2026-01-01 00:00:00')";
    txn.commit();
    EXPECT_FALSE(txn.is_active());
  }

  int count = 0;
  *conn << "SELECT COUNT(*) FROM folder_snapshots" >> count;
  EXPECT_EQ(count, 1);
}

}  // namespace facefind_core

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/db/pooled_connection.hpp"

namespace docqa_core {

class ConnectionPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_db_path_ = docqa_tests::TestUtilities::create_temp_test_db();
    // Use a larger pool in this suite to validate multi-connection behavior
    manager_ = std::make_unique<DatabaseManager>(temp_db_path_, /*pool_size*/ 4);
  }

  void TearDown() override {
    manager_.reset();
    docqa_tests::TestUtilities::cleanup_temp_file(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<DatabaseManager> manager_;
};

TEST_F(ConnectionPoolTest, ManagerCreatesSchema) {
  PooledConnection conn(*manager_);
  int tables = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN "
           "('documents', 'chunks')" >> tables;
  EXPECT_EQ(tables, 2);
  EXPECT_TRUE(manager_->is_open());
  EXPECT_EQ(manager_->db_path(), temp_db_path_);
}

TEST_F(ConnectionPoolTest, ForeignKeysAreEnforced) {
  PooledConnection conn(*manager_);
  int enabled = 0;
  *conn << "PRAGMA foreign_keys" >> enabled;
  EXPECT_EQ(enabled, 1);
}

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  // Borrow two connections
  PooledConnection c1(*manager_);
  PooledConnection c2(*manager_);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GE(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*manager_);
  auto holder2 = std::make_unique<PooledConnection>(*manager_);
  auto holder3 = std::make_unique<PooledConnection>(*manager_);
  auto holder4 = std::make_unique<PooledConnection>(*manager_);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  // Request another connection on another thread, which should block until one is returned
  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(*manager_);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, PoolTracksAvailableConnections) {
  ConnectionPool pool(temp_db_path_.string(), 2);
  EXPECT_EQ(pool.available(), 2u);

  auto conn = pool.get_connection();
  EXPECT_EQ(pool.available(), 1u);

  pool.return_connection(std::move(conn));
  EXPECT_EQ(pool.available(), 2u);
}

TEST_F(ConnectionPoolTest, ShutdownFailsPendingAndFutureBorrowers) {
  ConnectionPool pool(temp_db_path_.string(), 1);
  auto held = pool.get_connection();

  auto waiter = std::async(std::launch::async, [&pool]() { return pool.get_connection(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pool.shutdown();

  EXPECT_THROW(waiter.get(), std::runtime_error);
  EXPECT_THROW(pool.get_connection(), std::runtime_error);

  // Returning after shutdown drops the connection
  pool.return_connection(std::move(held));
  EXPECT_EQ(pool.available(), 0u);
}

TEST_F(ConnectionPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(ConnectionPool(temp_db_path_.string(), 0), std::invalid_argument);
}

TEST_F(ConnectionPoolTest, ManagerRefusesConnectionsAfterShutdown) {
  manager_->shutdown();
  EXPECT_FALSE(manager_->is_open());
  EXPECT_THROW(PooledConnection conn(*manager_), std::runtime_error);
  // A second shutdown is harmless
  manager_->shutdown();
}

TEST_F(ConnectionPoolTest, ManagerCreatesParentDirectory) {
  auto nested_dir = docqa_tests::TestUtilities::create_temp_path("_dir");
  auto nested_db = nested_dir / "sub" / "meta.db";
  {
    DatabaseManager nested(nested_db, 1);
    EXPECT_TRUE(std::filesystem::exists(nested_db));
  }
  std::error_code ec;
  std::filesystem::remove_all(nested_dir, ec);
}

} // namespace docqa_core

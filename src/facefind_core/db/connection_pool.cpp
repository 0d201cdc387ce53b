#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "facefind_core/db/connection_pool.hpp"
#include <stdexcept>

namespace facefind_core {

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("ConnectionPool requires at least one connection.");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_keyed_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native handle for connection in pool.");
  }

  if (sqlite3_key(handle, db_key_.c_str(), static_cast<int>(db_key_.length())) != SQLITE_OK) {
    throw std::runtime_error("Failed to key database for connection in pool: " +
                             std::string(sqlite3_errmsg(handle)));
  }

  // Fails here when the key does not match the file
  *db << "SELECT count(*) FROM sqlite_master;";

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
      pool_.pop();
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace facefind_core

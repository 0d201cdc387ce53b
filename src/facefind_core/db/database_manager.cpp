#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "facefind_core/db/database_manager.hpp"

#include <stdexcept>

namespace facefind_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  if (is_initialized_) {
    return;
  }
  if (db_key.empty()) {
    throw std::runtime_error("DatabaseManager requires a non-empty database key.");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Schema setup happens on a dedicated connection before the pool exists
  setup_schema(db_path, db_key);

  // 2. Pool shared by request handlers and workers
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  sqlite::database db(db_path.string());
  sqlite3* handle = db.connection().get();
  if (!handle) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw std::runtime_error("Setup: Failed to key database: " +
                             std::string(sqlite3_errmsg(handle)));
  }
  db << "SELECT count(*) FROM sqlite_master;";
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  // Content cache manifest. A row exists only for byte-complete files.
  db << R"(
      CREATE TABLE IF NOT EXISTS cache_entries (
          owner TEXT NOT NULL,
          source_scope TEXT NOT NULL,
          source_file_id TEXT NOT NULL,
          local_path TEXT NOT NULL,
          display_name TEXT NOT NULL,
          byte_size INTEGER NOT NULL,
          modified_marker TEXT NOT NULL,
          created_at TEXT NOT NULL,
          PRIMARY KEY (owner, source_scope, source_file_id)
      )
    )";

  // One row per processed photo, including photos with zero faces
  db << R"(
      CREATE TABLE IF NOT EXISTS photos (
          owner TEXT NOT NULL,
          photo_reference TEXT NOT NULL,
          face_count INTEGER NOT NULL,
          remote_synced INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL,
          PRIMARY KEY (owner, photo_reference)
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS face_embeddings (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          owner TEXT NOT NULL,
          photo_reference TEXT NOT NULL,
          face_index INTEGER NOT NULL,
          dimension INTEGER NOT NULL,
          embedding_blob BLOB NOT NULL,
          created_at TEXT NOT NULL,
          UNIQUE (owner, photo_reference, face_index),
          FOREIGN KEY (owner, photo_reference) REFERENCES photos(owner, photo_reference)
              ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS folder_snapshots (
          owner TEXT NOT NULL,
          source_scope TEXT NOT NULL,
          fingerprint TEXT NOT NULL,
          file_count INTEGER NOT NULL,
          processed_at TEXT NOT NULL,
          PRIMARY KEY (owner, source_scope)
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_photos_pending_sync
      ON photos(owner, remote_synced)
    )";
}

}  // namespace facefind_core

#include "facefind_core/db/cache_manifest_repo.hpp"

#include <functional>

#include "facefind_core/db/pooled_connection.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/db/transaction.hpp"
#include "facefind_core/util/time_format.hpp"

namespace facefind_core {

namespace {

using CacheRowCallback = std::function<void(std::string,
                                            std::string,
                                            std::string,
                                            std::string,
                                            std::string,
                                            int64_t,
                                            std::string,
                                            std::string)>;

CacheRowCallback collect_into(std::vector<CacheEntry>& out) {
  return [&out](std::string owner, std::string scope, std::string file_id, std::string local_path,
                std::string display_name, int64_t byte_size, std::string marker,
                std::string created_at) {
    CacheEntry entry;
    entry.owner = std::move(owner);
    entry.source_scope = std::move(scope);
    entry.source_file_id = std::move(file_id);
    entry.local_path = std::move(local_path);
    entry.display_name = std::move(display_name);
    entry.byte_size = static_cast<uint64_t>(byte_size);
    entry.modified_marker = std::move(marker);
    entry.created_at = string_to_time_point(created_at);
    out.push_back(std::move(entry));
  };
}

}  // namespace

CacheManifestRepo::CacheManifestRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::optional<CacheEntry> CacheManifestRepo::find(const std::string& owner,
                                                  const std::string& scope,
                                                  const std::string& file_id) {
  try {
    std::vector<CacheEntry> rows;
    PooledConnection conn(db_manager_);
    *conn << "SELECT owner, source_scope, source_file_id, local_path, display_name, byte_size, "
             "modified_marker, created_at FROM cache_entries "
             "WHERE owner = ? AND source_scope = ? AND source_file_id = ?"
          << owner << scope << file_id >>
        collect_into(rows);
    if (rows.empty()) {
      return std::nullopt;
    }
    return rows.front();
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.find", e);
  }
}

void CacheManifestRepo::publish(const CacheEntry& entry) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR REPLACE INTO cache_entries (owner, source_scope, source_file_id, "
             "local_path, display_name, byte_size, modified_marker, created_at) "
             "VALUES (?,?,?,?,?,?,?,?)"
          << entry.owner << entry.source_scope << entry.source_file_id << entry.local_path
          << entry.display_name << static_cast<int64_t>(entry.byte_size) << entry.modified_marker
          << time_point_to_string(entry.created_at);
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.publish", e);
  }
}

bool CacheManifestRepo::remove(const std::string& owner,
                               const std::string& scope,
                               const std::string& file_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM cache_entries WHERE owner = ? AND source_scope = ? AND source_file_id = ?"
          << owner << scope << file_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.remove", e);
  }
}

std::vector<CacheEntry> CacheManifestRepo::list(const std::string& owner,
                                                const std::optional<std::string>& scope) {
  try {
    std::vector<CacheEntry> rows;
    PooledConnection conn(db_manager_);
    if (scope) {
      *conn << "SELECT owner, source_scope, source_file_id, local_path, display_name, byte_size, "
               "modified_marker, created_at FROM cache_entries "
               "WHERE owner = ? AND source_scope = ? ORDER BY source_file_id"
            << owner << *scope >>
          collect_into(rows);
    } else {
      *conn << "SELECT owner, source_scope, source_file_id, local_path, display_name, byte_size, "
               "modified_marker, created_at FROM cache_entries "
               "WHERE owner = ? ORDER BY source_scope, source_file_id"
            << owner >>
          collect_into(rows);
    }
    return rows;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.list", e);
  }
}

int CacheManifestRepo::remove_all(const std::string& owner,
                                  const std::optional<std::string>& scope) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    if (scope) {
      *conn << "DELETE FROM cache_entries WHERE owner = ? AND source_scope = ?" << owner << *scope;
    } else {
      *conn << "DELETE FROM cache_entries WHERE owner = ?" << owner;
    }
    int removed = conn->rows_modified();
    tx.commit();
    return removed;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.remove_all", e);
  }
}

CacheStats CacheManifestRepo::stats(const std::string& owner) {
  try {
    CacheStats stats;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*), COALESCE(SUM(byte_size), 0) FROM cache_entries WHERE owner = ?"
          << owner >>
        [&](int64_t count, int64_t bytes) {
          stats.entry_count = count;
          stats.total_bytes = bytes;
        };
    return stats;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("cache_manifest.stats", e);
  }
}

}  // namespace facefind_core

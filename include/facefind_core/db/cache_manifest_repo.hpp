#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "facefind_core/db/database_manager.hpp"

namespace facefind_core {

struct CacheEntry {
  std::string owner;
  std::string source_scope;
  std::string source_file_id;
  std::string local_path;
  std::string display_name;
  uint64_t byte_size = 0;
  std::string modified_marker;
  std::chrono::system_clock::time_point created_at;
};

struct CacheStats {
  int64_t entry_count = 0;
  int64_t total_bytes = 0;
};

/**
 * @class CacheManifestRepo
 * @brief Index of byte-complete cached source files keyed by (owner, scope, file id).
 *
 * Every method throws LocalStoreError on SQLite failure.
 */
class CacheManifestRepo {
 public:
  explicit CacheManifestRepo(DatabaseManager& db_manager);

  std::optional<CacheEntry> find(const std::string& owner,
                                 const std::string& scope,
                                 const std::string& file_id);

  // Inserts the entry, replacing any existing row for the same key.
  void publish(const CacheEntry& entry);

  bool remove(const std::string& owner, const std::string& scope, const std::string& file_id);

  std::vector<CacheEntry> list(const std::string& owner,
                               const std::optional<std::string>& scope = std::nullopt);

  int remove_all(const std::string& owner, const std::optional<std::string>& scope = std::nullopt);

  CacheStats stats(const std::string& owner);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace facefind_core

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "facefind_core/db/database_manager.hpp"
#include "facefind_core/types/source_file.hpp"

namespace facefind_core {

struct FolderSnapshot {
  std::string owner;
  std::string source_scope;
  std::string fingerprint;
  int file_count = 0;
  std::chrono::system_clock::time_point processed_at;
};

// Remembers the listing fingerprint of the last completed run per folder.
class FolderSnapshotRepo {
 public:
  explicit FolderSnapshotRepo(DatabaseManager& db_manager);

  // Order-independent digest over (id, name, size, marker) of every file.
  static std::string fingerprint(const std::vector<SourceFile>& files);

  std::optional<FolderSnapshot> find(const std::string& owner, const std::string& scope);
  void save(const FolderSnapshot& snapshot);
  int remove_all(const std::string& owner, const std::optional<std::string>& scope = std::nullopt);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace facefind_core

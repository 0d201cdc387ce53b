#include "facefind_core/db/folder_snapshot_repo.hpp"

#include <algorithm>
#include <sstream>

#include "facefind_core/db/pooled_connection.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/util/digest.hpp"
#include "facefind_core/util/time_format.hpp"

namespace facefind_core {

FolderSnapshotRepo::FolderSnapshotRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::string FolderSnapshotRepo::fingerprint(const std::vector<SourceFile>& files) {
  std::vector<const SourceFile*> sorted;
  sorted.reserve(files.size());
  for (const auto& file : files) {
    sorted.push_back(&file);
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const SourceFile* a, const SourceFile* b) { return a->id < b->id; });

  std::ostringstream canonical;
  for (const SourceFile* file : sorted) {
    canonical << file->id << '\t' << file->display_name << '\t' << file->byte_size << '\t'
              << file->modified_marker << '\n';
  }
  return sha256_hex(canonical.str());
}

std::optional<FolderSnapshot> FolderSnapshotRepo::find(const std::string& owner,
                                                       const std::string& scope) {
  try {
    std::optional<FolderSnapshot> snapshot;
    PooledConnection conn(db_manager_);
    *conn << "SELECT fingerprint, file_count, processed_at FROM folder_snapshots "
             "WHERE owner = ? AND source_scope = ?"
          << owner << scope >>
        [&](std::string fingerprint, int file_count, std::string processed_at) {
          FolderSnapshot row;
          row.owner = owner;
          row.source_scope = scope;
          row.fingerprint = std::move(fingerprint);
          row.file_count = file_count;
          row.processed_at = string_to_time_point(processed_at);
          snapshot = std::move(row);
        };
    return snapshot;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("folder_snapshot.find", e);
  }
}

void FolderSnapshotRepo::save(const FolderSnapshot& snapshot) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR REPLACE INTO folder_snapshots (owner, source_scope, fingerprint, "
             "file_count, processed_at) VALUES (?,?,?,?,?)"
          << snapshot.owner << snapshot.source_scope << snapshot.fingerprint
          << snapshot.file_count << time_point_to_string(snapshot.processed_at);
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("folder_snapshot.save", e);
  }
}

int FolderSnapshotRepo::remove_all(const std::string& owner,
                                   const std::optional<std::string>& scope) {
  try {
    PooledConnection conn(db_manager_);
    if (scope) {
      *conn << "DELETE FROM folder_snapshots WHERE owner = ? AND source_scope = ?" << owner
            << *scope;
    } else {
      *conn << "DELETE FROM folder_snapshots WHERE owner = ?" << owner;
    }
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("folder_snapshot.remove_all", e);
  }
}

}  // namespace facefind_core

#include "facefind_core/db/local_embedding_repo.hpp"

#include <cstring>
#include <map>

#include "facefind_core/db/pooled_connection.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/db/transaction.hpp"
#include "facefind_core/util/time_format.hpp"

namespace facefind_core {

namespace {

std::vector<char> to_blob(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> from_blob(const std::vector<char>& blob, int dimension) {
  if (dimension < 0 || blob.size() != static_cast<size_t>(dimension) * sizeof(float)) {
    throw LocalStoreError("Stored embedding blob does not match its dimension (" +
                          std::to_string(blob.size()) + " bytes for dimension " +
                          std::to_string(dimension) + ")");
  }
  std::vector<float> vector(static_cast<size_t>(dimension));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), blob.size());
  }
  return vector;
}

}  // namespace

LocalEmbeddingRepo::LocalEmbeddingRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

bool LocalEmbeddingRepo::photo_exists(const std::string& owner, const std::string& photo_reference) {
  try {
    bool exists = false;
    PooledConnection conn(db_manager_);
    *conn << "SELECT 1 FROM photos WHERE owner = ? AND photo_reference = ? LIMIT 1" << owner
          << photo_reference >>
        [&](int /*dummy*/) { exists = true; };
    return exists;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("photo_exists", e);
  }
}

void LocalEmbeddingRepo::replace_photo(const std::string& owner,
                                       const std::string& photo_reference,
                                       const std::vector<FaceEmbedding>& faces,
                                       bool remote_synced) {
  try {
    const std::string now = time_point_to_string(std::chrono::system_clock::now());
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    std::string created_at = now;
    *conn << "SELECT created_at FROM photos WHERE owner = ? AND photo_reference = ?" << owner
          << photo_reference >>
        [&](std::string existing) { created_at = existing; };

    // Old faces go first so a smaller new set never leaves stale indexes behind
    *conn << "DELETE FROM face_embeddings WHERE owner = ? AND photo_reference = ?" << owner
          << photo_reference;
    *conn << "INSERT OR REPLACE INTO photos (owner, photo_reference, face_count, remote_synced, "
             "created_at, updated_at) VALUES (?,?,?,?,?,?)"
          << owner << photo_reference << static_cast<int>(faces.size())
          << (remote_synced ? 1 : 0) << created_at << now;

    for (const auto& face : faces) {
      *conn << "INSERT INTO face_embeddings (owner, photo_reference, face_index, dimension, "
               "embedding_blob, created_at) VALUES (?,?,?,?,?,?)"
            << owner << photo_reference << face.face_index << face.dimension()
            << to_blob(face.vector)
            << time_point_to_string(face.created_at.time_since_epoch().count() == 0
                                        ? std::chrono::system_clock::now()
                                        : face.created_at);
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("replace_photo", e);
  }
}

std::optional<std::vector<FaceEmbedding>> LocalEmbeddingRepo::get_photo(
    const std::string& owner, const std::string& photo_reference) {
  if (!photo_exists(owner, photo_reference)) {
    return std::nullopt;
  }
  try {
    std::vector<FaceEmbedding> faces;
    PooledConnection conn(db_manager_);
    *conn << "SELECT face_index, dimension, embedding_blob, created_at FROM face_embeddings "
             "WHERE owner = ? AND photo_reference = ? ORDER BY face_index"
          << owner << photo_reference >>
        [&](int face_index, int dimension, std::vector<char> blob, std::string created_at) {
          FaceEmbedding face;
          face.owner = owner;
          face.photo_reference = photo_reference;
          face.face_index = face_index;
          face.vector = from_blob(blob, dimension);
          face.created_at = string_to_time_point(created_at);
          faces.push_back(std::move(face));
        };
    return faces;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("get_photo", e);
  }
}

std::vector<PhotoFaces> LocalEmbeddingRepo::get_all(const std::string& owner) {
  try {
    // std::map keeps the result ordered by photo reference
    std::map<std::string, PhotoFaces> by_photo;
    PooledConnection conn(db_manager_);
    *conn << "SELECT photo_reference FROM photos WHERE owner = ?" << owner >>
        [&](std::string photo_reference) {
          by_photo[photo_reference].photo_reference = photo_reference;
        };
    *conn << "SELECT photo_reference, face_index, dimension, embedding_blob, created_at "
             "FROM face_embeddings WHERE owner = ? ORDER BY photo_reference, face_index"
          << owner >>
        [&](std::string photo_reference, int face_index, int dimension, std::vector<char> blob,
            std::string created_at) {
          FaceEmbedding face;
          face.owner = owner;
          face.photo_reference = photo_reference;
          face.face_index = face_index;
          face.vector = from_blob(blob, dimension);
          face.created_at = string_to_time_point(created_at);
          by_photo[photo_reference].faces.push_back(std::move(face));
        };

    std::vector<PhotoFaces> photos;
    photos.reserve(by_photo.size());
    for (auto& [reference, photo] : by_photo) {
      photo.photo_reference = reference;
      photos.push_back(std::move(photo));
    }
    return photos;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("get_all", e);
  }
}

void LocalEmbeddingRepo::mark_remote_synced(const std::string& owner,
                                            const std::string& photo_reference) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE photos SET remote_synced = 1 WHERE owner = ? AND photo_reference = ?" << owner
          << photo_reference;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("mark_remote_synced", e);
  }
}

std::vector<std::string> LocalEmbeddingRepo::pending_remote(const std::string& owner) {
  try {
    std::vector<std::string> references;
    PooledConnection conn(db_manager_);
    *conn << "SELECT photo_reference FROM photos WHERE owner = ? AND remote_synced = 0 "
             "ORDER BY photo_reference"
          << owner >>
        [&](std::string photo_reference) { references.push_back(std::move(photo_reference)); };
    return references;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("pending_remote", e);
  }
}

bool LocalEmbeddingRepo::remove_photo(const std::string& owner,
                                      const std::string& photo_reference) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM face_embeddings WHERE owner = ? AND photo_reference = ?" << owner
          << photo_reference;
    *conn << "DELETE FROM photos WHERE owner = ? AND photo_reference = ?" << owner
          << photo_reference;
    bool removed = conn->rows_modified() > 0;
    tx.commit();
    return removed;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("remove_photo", e);
  }
}

LocalTierStats LocalEmbeddingRepo::stats(const std::string& owner) {
  try {
    LocalTierStats stats;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*), COALESCE(SUM(face_count), 0), "
             "COALESCE(SUM(CASE WHEN remote_synced = 0 THEN 1 ELSE 0 END), 0) "
             "FROM photos WHERE owner = ?"
          << owner >>
        [&](int64_t photos, int64_t faces, int64_t pending) {
          stats.photo_count = photos;
          stats.face_count = faces;
          stats.pending_remote = pending;
        };
    return stats;
  } catch (const sqlite::sqlite_exception& e) {
    throw LocalStoreError("local_tier_stats", e);
  }
}

}  // namespace facefind_core

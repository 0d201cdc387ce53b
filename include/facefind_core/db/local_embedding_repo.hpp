#pragma once

#include <optional>
#include <string>
#include <vector>

#include "facefind_core/db/database_manager.hpp"
#include "facefind_core/types/face_embedding.hpp"

namespace facefind_core {

struct LocalTierStats {
  int64_t photo_count = 0;
  int64_t face_count = 0;
  int64_t pending_remote = 0;
};

/**
 * @class LocalEmbeddingRepo
 * @brief Local tier of the embedding store.
 *
 * A photo is "present" once it has a row in `photos`, even with zero faces.
 * Face vectors are stored as raw float blobs together with their dimension.
 */
class LocalEmbeddingRepo {
 public:
  explicit LocalEmbeddingRepo(DatabaseManager& db_manager);
  virtual ~LocalEmbeddingRepo() = default;

  virtual bool photo_exists(const std::string& owner, const std::string& photo_reference);

  // Replaces the whole face set of a photo in one transaction.
  virtual void replace_photo(const std::string& owner,
                     const std::string& photo_reference,
                     const std::vector<FaceEmbedding>& faces,
                     bool remote_synced);

  // std::nullopt when the photo has never been stored.
  std::optional<std::vector<FaceEmbedding>> get_photo(const std::string& owner,
                                                      const std::string& photo_reference);

  std::vector<PhotoFaces> get_all(const std::string& owner);

  void mark_remote_synced(const std::string& owner, const std::string& photo_reference);
  std::vector<std::string> pending_remote(const std::string& owner);

  bool remove_photo(const std::string& owner, const std::string& photo_reference);

  LocalTierStats stats(const std::string& owner);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace facefind_core

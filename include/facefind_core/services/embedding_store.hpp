#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "facefind_core/db/local_embedding_repo.hpp"
#include "facefind_core/remote/remote_embedding_store.hpp"
#include "facefind_core/types/face_embedding.hpp"

namespace facefind_core {

enum class PutStatus { Stored, AlreadyPresent };

struct PutResult {
  PutStatus status = PutStatus::Stored;
  size_t faces_written = 0;
  bool remote_synced = false;
  // Set when the remote write failed; the local write still succeeded
  std::optional<std::string> remote_error;
};

struct TierRead {
  std::vector<PhotoFaces> photos;
  bool from_remote = false;
};

struct ReconcileResult {
  int pushed = 0;
  int failed = 0;
  std::vector<std::string> errors;
};

/**
 * @class EmbeddingStore
 * @brief Two-tier face embedding store: authoritative local SQLite tier in
 * front of an optional remote tier.
 *
 * Writes go to the local tier first; a failing remote write is reported in
 * the PutResult and leaves the photo pending until reconcile(). Reads fall
 * through to the remote tier on a local miss and fill the local tier.
 */
class EmbeddingStore {
 public:
  EmbeddingStore(std::shared_ptr<LocalEmbeddingRepo> local,
                 std::shared_ptr<RemoteEmbeddingStore> remote = nullptr);

  bool exists(const std::string& owner, const std::string& photo_reference);

  // Without `force`, an already-present photo is left untouched.
  PutResult put(const std::string& owner,
                const std::string& photo_reference,
                const std::vector<std::vector<float>>& vectors,
                bool force = false);

  std::optional<std::vector<FaceEmbedding>> get(const std::string& owner,
                                                const std::string& photo_reference);

  TierRead get_all(const std::string& owner, bool fill_local = true);

  // Same tier precedence as get_all(); returns the number of photos visited.
  size_t for_each_photo(const std::string& owner,
                        const std::function<void(const PhotoFaces&)>& fn,
                        bool fill_local = true);

  ReconcileResult reconcile(const std::string& owner);

  LocalTierStats stats(const std::string& owner);

  bool has_remote() const {
    return remote_ != nullptr;
  }

 private:
  std::shared_ptr<LocalEmbeddingRepo> local_;
  std::shared_ptr<RemoteEmbeddingStore> remote_;
};

}  // namespace facefind_core

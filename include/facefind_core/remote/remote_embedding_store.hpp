#pragma once

#include <optional>
#include <string>
#include <vector>

#include "facefind_core/types/face_embedding.hpp"

namespace facefind_core {

class RemoteStoreError : public std::exception {
 public:
  explicit RemoteStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class RemoteEmbeddingStore
 * @brief Durable, slower tier of the embedding store.
 *
 * Implementations must make replace_photo idempotent: writing the same face
 * set twice leaves one copy. Failures raise RemoteStoreError.
 */
class RemoteEmbeddingStore {
 public:
  virtual ~RemoteEmbeddingStore() = default;

  virtual void replace_photo(const std::string& owner,
                             const std::string& photo_reference,
                             const std::vector<FaceEmbedding>& faces) = 0;

  virtual std::optional<std::vector<FaceEmbedding>> get_photo(
      const std::string& owner, const std::string& photo_reference) = 0;

  virtual std::vector<PhotoFaces> get_all(const std::string& owner) = 0;
};

}  // namespace facefind_core

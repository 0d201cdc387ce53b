#include "facefind_core/services/embedding_store.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace facefind_core {

EmbeddingStore::EmbeddingStore(std::shared_ptr<LocalEmbeddingRepo> local,
                               std::shared_ptr<RemoteEmbeddingStore> remote)
    : local_(std::move(local)), remote_(std::move(remote)) {
  if (!local_) {
    throw std::invalid_argument("EmbeddingStore requires a local tier.");
  }
}

bool EmbeddingStore::exists(const std::string& owner, const std::string& photo_reference) {
  return local_->photo_exists(owner, photo_reference);
}

PutResult EmbeddingStore::put(const std::string& owner,
                              const std::string& photo_reference,
                              const std::vector<std::vector<float>>& vectors,
                              bool force) {
  PutResult result;
  if (!force && local_->photo_exists(owner, photo_reference)) {
    result.status = PutStatus::AlreadyPresent;
    return result;
  }

  const auto now = std::chrono::system_clock::now();
  std::vector<FaceEmbedding> faces;
  faces.reserve(vectors.size());
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].empty() || vectors[i].size() != vectors.front().size()) {
      throw std::invalid_argument("Faces of " + photo_reference +
                                  " must share a non-zero dimension");
    }
    FaceEmbedding face;
    face.owner = owner;
    face.photo_reference = photo_reference;
    face.face_index = static_cast<int>(i);
    face.vector = vectors[i];
    face.created_at = now;
    faces.push_back(std::move(face));
  }

  local_->replace_photo(owner, photo_reference, faces, /*remote_synced*/ false);
  result.faces_written = faces.size();

  if (!remote_) {
    return result;
  }
  try {
    remote_->replace_photo(owner, photo_reference, faces);
    local_->mark_remote_synced(owner, photo_reference);
    result.remote_synced = true;
  } catch (const RemoteStoreError& e) {
    std::cerr << "EmbeddingStore: remote write for " << photo_reference
              << " failed, kept local only: " << e.what() << std::endl;
    result.remote_error = e.what();
  }
  return result;
}

std::optional<std::vector<FaceEmbedding>> EmbeddingStore::get(const std::string& owner,
                                                              const std::string& photo_reference) {
  std::optional<std::vector<FaceEmbedding>> faces = local_->get_photo(owner, photo_reference);
  if (faces || !remote_) {
    return faces;
  }

  faces = remote_->get_photo(owner, photo_reference);
  if (faces) {
    local_->replace_photo(owner, photo_reference, *faces, /*remote_synced*/ true);
  }
  return faces;
}

TierRead EmbeddingStore::get_all(const std::string& owner, bool fill_local) {
  TierRead read;
  read.photos = local_->get_all(owner);
  if (!read.photos.empty() || !remote_) {
    return read;
  }

  read.photos = remote_->get_all(owner);
  read.from_remote = true;
  if (fill_local) {
    for (const auto& photo : read.photos) {
      local_->replace_photo(owner, photo.photo_reference, photo.faces, /*remote_synced*/ true);
    }
    std::cout << "EmbeddingStore: warmed local tier with " << read.photos.size()
              << " photos for owner " << owner << std::endl;
  }
  return read;
}

size_t EmbeddingStore::for_each_photo(const std::string& owner,
                                     const std::function<void(const PhotoFaces&)>& fn,
                                     bool fill_local) {
  TierRead read = get_all(owner, fill_local);
  for (const auto& photo : read.photos) {
    fn(photo);
  }
  return read.photos.size();
}

ReconcileResult EmbeddingStore::reconcile(const std::string& owner) {
  ReconcileResult result;
  if (!remote_) {
    return result;
  }

  for (const auto& reference : local_->pending_remote(owner)) {
    std::optional<std::vector<FaceEmbedding>> faces = local_->get_photo(owner, reference);
    if (!faces) {
      continue;
    }
    try {
      remote_->replace_photo(owner, reference, *faces);
      local_->mark_remote_synced(owner, reference);
      ++result.pushed;
    } catch (const RemoteStoreError& e) {
      ++result.failed;
      result.errors.push_back(reference + ": " + e.what());
    }
  }
  return result;
}

LocalTierStats EmbeddingStore::stats(const std::string& owner) {
  return local_->stats(owner);
}

}  // namespace facefind_core

#pragma once

#include <functional>

#include <nlohmann/json.hpp>

#include "facefind_core/net/http_client.hpp"
#include "facefind_core/remote/remote_embedding_store.hpp"

namespace facefind_core {

/**
 * @class RestRemoteEmbeddingStore
 * @brief Remote tier stored in a PostgREST `faces` table.
 *
 * Row columns: owner, photo_reference, face_index, dimension, embedding
 * (JSON array), created_at, updated_at. A photo with no faces is kept as a
 * single marker row with face_index -1 and an empty embedding.
 *
 * get_all() pages through the table with limit/offset, since PostgREST caps
 * every response at the server's max-rows setting.
 */
class RestRemoteEmbeddingStore : public RemoteEmbeddingStore {
 public:
  static constexpr int kNoFaceMarkerIndex = -1;
  static constexpr size_t kDefaultPageSize = 1000;

  RestRemoteEmbeddingStore(std::string base_url,
                           const std::string& api_key,
                           long timeout_seconds = 30,
                           size_t page_size = kDefaultPageSize);

  void replace_photo(const std::string& owner,
                     const std::string& photo_reference,
                     const std::vector<FaceEmbedding>& faces) override;

  std::optional<std::vector<FaceEmbedding>> get_photo(const std::string& owner,
                                                      const std::string& photo_reference) override;

  std::vector<PhotoFaces> get_all(const std::string& owner) override;

  static nlohmann::json to_rows(const std::string& owner,
                                const std::string& photo_reference,
                                const std::vector<FaceEmbedding>& faces);

  // Groups rows by photo reference; marker rows yield photos without faces.
  static std::vector<PhotoFaces> from_rows(const nlohmann::json& rows);

  using PageFetcher = std::function<nlohmann::json(size_t offset, size_t limit)>;

  // Concatenates pages until one comes back empty. A server cap below
  // `page_size` only shortens the pages, so a short page does not end the read.
  static nlohmann::json collect_pages(const PageFetcher& fetch_page, size_t page_size);

 private:
  std::string table_url() const;

  std::string base_url_;
  size_t page_size_;
  HttpClient client_;
};

}  // namespace facefind_core

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "facefind_core/recognition/embedding_producer.hpp"
#include "facefind_core/services/embedding_store.hpp"
#include "facefind_core/services/threshold_policy.hpp"

namespace facefind_core {

class SearchServiceError : public std::exception {
 public:
  explicit SearchServiceError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SearchQuery {
  std::vector<std::vector<float>> embeddings;
  ThresholdTier tier = ThresholdTier::Standard;
  std::optional<float> raw_threshold;
  // Unbounded when empty
  std::optional<size_t> limit;
};

struct SearchMatch {
  std::string photo_reference;
  float score = 0.0f;
};

struct SearchResult {
  std::vector<SearchMatch> matches;
  float threshold = 0.0f;
  bool from_remote = false;
  size_t photos_scanned = 0;
  size_t faces_scanned = 0;
};

/**
 * @class SearchService
 * @brief Threshold-ranked face similarity search over an owner's photos.
 *
 * Scores are cosine similarities. A photo matches when any of its faces is
 * above the cutoff against any query face, and is reported once with its
 * best score. Results are sorted by score, highest first.
 */
class SearchService {
 public:
  SearchService(std::shared_ptr<EmbeddingStore> store,
                std::shared_ptr<EmbeddingProducer> producer,
                ThresholdPolicy policy = ThresholdPolicy{},
                bool warm_local_on_remote_fallback = true);

  SearchResult search(const std::string& owner, const SearchQuery& query);

  // Embeds every face of a reference image and searches with all of them.
  SearchResult search_by_image(const std::string& owner,
                               const std::vector<unsigned char>& image_bytes,
                               ThresholdTier tier = ThresholdTier::Standard,
                               const std::optional<float>& raw_threshold = std::nullopt,
                               const std::optional<size_t>& limit = std::nullopt);

  const ThresholdPolicy& policy() const {
    return policy_;
  }

 private:
  std::vector<SearchMatch> rank(const std::vector<PhotoFaces>& photos,
                                const std::vector<std::vector<float>>& queries,
                                float threshold,
                                size_t& faces_scanned) const;

  std::shared_ptr<EmbeddingStore> store_;
  std::shared_ptr<EmbeddingProducer> producer_;
  ThresholdPolicy policy_;
  bool warm_local_on_remote_fallback_;
};

}  // namespace facefind_core

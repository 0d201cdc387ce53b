#include "facefind_core/services/search_service.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/impl/AuxIndexStructures.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <iostream>
#include <unordered_map>

namespace facefind_core {

SearchService::SearchService(std::shared_ptr<EmbeddingStore> store,
                             std::shared_ptr<EmbeddingProducer> producer,
                             ThresholdPolicy policy,
                             bool warm_local_on_remote_fallback)
    : store_(std::move(store)),
      producer_(std::move(producer)),
      policy_(policy),
      warm_local_on_remote_fallback_(warm_local_on_remote_fallback) {}

SearchResult SearchService::search(const std::string& owner, const SearchQuery& query) {
  if (query.embeddings.empty()) {
    throw SearchServiceError("Search needs at least one query embedding");
  }
  const size_t dimension = query.embeddings.front().size();
  for (const auto& embedding : query.embeddings) {
    if (embedding.empty() || embedding.size() != dimension) {
      throw SearchServiceError("Query embeddings must share a non-zero dimension");
    }
  }

  SearchResult result;
  try {
    result.threshold = policy_.resolve(query.tier, query.raw_threshold);
  } catch (const std::invalid_argument& e) {
    throw SearchServiceError(e.what());
  }

  TierRead read = store_->get_all(owner, warm_local_on_remote_fallback_);
  result.from_remote = read.from_remote;
  result.photos_scanned = read.photos.size();
  result.matches = rank(read.photos, query.embeddings, result.threshold, result.faces_scanned);

  if (query.limit && result.matches.size() > *query.limit) {
    result.matches.resize(*query.limit);
  }
  return result;
}

SearchResult SearchService::search_by_image(const std::string& owner,
                                            const std::vector<unsigned char>& image_bytes,
                                            ThresholdTier tier,
                                            const std::optional<float>& raw_threshold,
                                            const std::optional<size_t>& limit) {
  if (!producer_) {
    throw SearchServiceError("No embedding producer configured for reference images");
  }
  SearchQuery query;
  query.embeddings = producer_->detect_and_embed(image_bytes);
  if (query.embeddings.empty()) {
    throw SearchServiceError("No face detected in the reference image");
  }
  query.tier = tier;
  query.raw_threshold = raw_threshold;
  query.limit = limit;
  return search(owner, query);
}

std::vector<SearchMatch> SearchService::rank(const std::vector<PhotoFaces>& photos,
                                             const std::vector<std::vector<float>>& queries,
                                             float threshold,
                                             size_t& faces_scanned) const {
  const size_t dimension = queries.front().size();

  // Faiss label -> index into `photos`
  std::vector<size_t> face_owner;
  std::vector<float> stored_flat;
  size_t skipped_dimension = 0;
  for (size_t p = 0; p < photos.size(); ++p) {
    for (const auto& face : photos[p].faces) {
      if (face.vector.size() != dimension) {
        ++skipped_dimension;
        continue;
      }
      face_owner.push_back(p);
      stored_flat.insert(stored_flat.end(), face.vector.begin(), face.vector.end());
    }
  }
  faces_scanned = face_owner.size();
  if (skipped_dimension > 0) {
    std::cerr << "SearchService: ignored " << skipped_dimension
              << " stored faces with a dimension other than " << dimension << std::endl;
  }
  if (face_owner.empty()) {
    return {};
  }

  std::vector<float> query_flat;
  query_flat.reserve(queries.size() * dimension);
  for (const auto& query : queries) {
    query_flat.insert(query_flat.end(), query.begin(), query.end());
  }

  // Inner product on unit vectors is cosine similarity
  faiss::fvec_renorm_L2(dimension, face_owner.size(), stored_flat.data());
  faiss::fvec_renorm_L2(dimension, queries.size(), query_flat.data());

  faiss::IndexFlatIP base_index(static_cast<faiss::idx_t>(dimension));
  faiss::IndexIDMap index(&base_index);
  std::vector<faiss::idx_t> ids(face_owner.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    ids[i] = static_cast<faiss::idx_t>(i);
  }
  index.add_with_ids(static_cast<faiss::idx_t>(face_owner.size()), stored_flat.data(), ids.data());

  faiss::RangeSearchResult hits(static_cast<faiss::idx_t>(queries.size()));
  index.range_search(static_cast<faiss::idx_t>(queries.size()), query_flat.data(), threshold,
                     &hits);

  std::unordered_map<size_t, float> best_by_photo;
  for (size_t q = 0; q < queries.size(); ++q) {
    for (size_t j = hits.lims[q]; j < hits.lims[q + 1]; ++j) {
      const size_t photo = face_owner[static_cast<size_t>(hits.labels[j])];
      const float score = hits.distances[j];
      auto it = best_by_photo.find(photo);
      if (it == best_by_photo.end() || score > it->second) {
        best_by_photo[photo] = score;
      }
    }
  }

  std::vector<SearchMatch> matches;
  matches.reserve(best_by_photo.size());
  for (const auto& [photo, score] : best_by_photo) {
    matches.push_back({photos[photo].photo_reference, score});
  }
  std::sort(matches.begin(), matches.end(), [](const SearchMatch& a, const SearchMatch& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.photo_reference < b.photo_reference;
  });
  return matches;
}

}  // namespace facefind_core

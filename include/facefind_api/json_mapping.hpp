#pragma once

#include <nlohmann/json.hpp>

#include "facefind_core/db/cache_manifest_repo.hpp"
#include "facefind_core/db/local_embedding_repo.hpp"
#include "facefind_core/progress/processing_job.hpp"
#include "facefind_core/services/embedding_store.hpp"
#include "facefind_core/services/search_service.hpp"

namespace facefind_api {

nlohmann::json to_json(const facefind_core::JobSnapshot& snapshot);
nlohmann::json to_json(const facefind_core::SearchResult& result);
nlohmann::json to_json(const facefind_core::ReconcileResult& result);
nlohmann::json stats_to_json(const facefind_core::CacheStats& cache,
                             const facefind_core::LocalTierStats& store);

// Reads {queries, tier | threshold, limit}. Throws std::invalid_argument on bad input.
facefind_core::SearchQuery parse_search_request(const nlohmann::json& body);

}  // namespace facefind_api

#include "facefind_api/json_mapping.hpp"

#include "facefind_core/util/time_format.hpp"

namespace facefind_api {

namespace {

nlohmann::json issues_to_json(const std::vector<facefind_core::JobIssue>& issues) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& issue : issues) {
    out.push_back({{"file_id", issue.file_id},
                   {"photo_reference", issue.photo_reference},
                   {"step", facefind_core::to_string(issue.step)},
                   {"message", issue.message}});
  }
  return out;
}

}  // namespace

nlohmann::json to_json(const facefind_core::JobSnapshot& snapshot) {
  using facefind_core::ProcessingStep;

  nlohmann::json steps = nlohmann::json::object();
  for (auto step : {ProcessingStep::Download, ProcessingStep::Detect, ProcessingStep::Embed,
                    ProcessingStep::Store}) {
    const auto& progress = snapshot.step(step);
    steps[facefind_core::to_string(step)] = {{"total", progress.total},
                                             {"completed", progress.completed}};
  }

  nlohmann::json out;
  out["owner"] = snapshot.owner;
  out["folder"] = snapshot.folder;
  out["state"] = facefind_core::to_string(snapshot.state);
  out["force_reprocess"] = snapshot.force_reprocess;
  out["current_step"] = snapshot.current_step
                            ? nlohmann::json(facefind_core::to_string(*snapshot.current_step))
                            : nlohmann::json(nullptr);
  out["steps"] = steps;
  out["total_items"] = snapshot.total_items;
  out["processed"] = snapshot.processed;
  out["skipped"] = snapshot.skipped;
  out["failed"] = snapshot.failed;
  out["cancelled"] = snapshot.cancelled;
  out["faces_stored"] = snapshot.faces_stored;
  out["percent"] = snapshot.percent;
  out["warnings"] = issues_to_json(snapshot.warnings);
  out["errors"] = issues_to_json(snapshot.errors);
  out["started_at"] = snapshot.started_at
                          ? nlohmann::json(facefind_core::time_point_to_string(*snapshot.started_at))
                          : nlohmann::json(nullptr);
  out["finished_at"] =
      snapshot.finished_at
          ? nlohmann::json(facefind_core::time_point_to_string(*snapshot.finished_at))
          : nlohmann::json(nullptr);
  out["elapsed_seconds"] = snapshot.elapsed_seconds;
  out["eta_seconds"] =
      snapshot.eta_seconds ? nlohmann::json(*snapshot.eta_seconds) : nlohmann::json(nullptr);
  out["source_unchanged"] = snapshot.source_unchanged;
  if (!snapshot.failure_reason.empty()) {
    out["failure_reason"] = snapshot.failure_reason;
  }
  return out;
}

nlohmann::json to_json(const facefind_core::SearchResult& result) {
  nlohmann::json matches = nlohmann::json::array();
  for (const auto& match : result.matches) {
    matches.push_back({{"photo_reference", match.photo_reference}, {"score", match.score}});
  }
  return {{"matches", matches},
          {"threshold", result.threshold},
          {"from_remote", result.from_remote},
          {"photos_scanned", result.photos_scanned},
          {"faces_scanned", result.faces_scanned}};
}

nlohmann::json to_json(const facefind_core::ReconcileResult& result) {
  return {{"pushed", result.pushed}, {"failed", result.failed}, {"errors", result.errors}};
}

nlohmann::json stats_to_json(const facefind_core::CacheStats& cache,
                             const facefind_core::LocalTierStats& store) {
  return {{"cached_files", cache.entry_count},
          {"cached_bytes", cache.total_bytes},
          {"processed_photos", store.photo_count},
          {"stored_faces", store.face_count},
          {"pending_remote_sync", store.pending_remote}};
}

facefind_core::SearchQuery parse_search_request(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("Search request must be a JSON object");
  }

  facefind_core::SearchQuery query;
  try {
    if (body.contains("queries")) {
      query.embeddings = body.at("queries").get<std::vector<std::vector<float>>>();
    } else if (body.contains("embedding")) {
      query.embeddings.push_back(body.at("embedding").get<std::vector<float>>());
    }
    if (body.contains("tier")) {
      query.tier = facefind_core::threshold_tier_from_string(body.at("tier").get<std::string>());
    }
    if (body.contains("threshold") && !body.at("threshold").is_null()) {
      query.raw_threshold = body.at("threshold").get<float>();
    }
    if (body.contains("limit") && !body.at("limit").is_null()) {
      const int limit = body.at("limit").get<int>();
      if (limit <= 0) {
        throw std::invalid_argument("limit must be positive");
      }
      query.limit = static_cast<size_t>(limit);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Malformed search request: ") + e.what());
  }

  if (query.embeddings.empty()) {
    throw std::invalid_argument("Search request needs 'queries' or 'embedding'");
  }
  return query;
}

}  // namespace facefind_api

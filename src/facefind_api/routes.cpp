#include "facefind_api/routes.hpp"

#include <iostream>

#include "facefind_api/json_mapping.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/progress/job_tracker.hpp"
#include "facefind_core/recognition/embedding_producer.hpp"
#include "facefind_core/services/content_cache.hpp"
#include "facefind_core/services/embedding_store.hpp"
#include "facefind_core/services/processing_orchestrator.hpp"
#include "facefind_core/services/search_service.hpp"

namespace facefind_api {
Routes::Routes(std::shared_ptr<facefind_core::ProcessingOrchestrator> orchestrator,
               std::shared_ptr<facefind_core::JobTracker> tracker,
               std::shared_ptr<facefind_core::SearchService> search_service,
               std::shared_ptr<facefind_core::EmbeddingStore> embedding_store,
               std::shared_ptr<facefind_core::ContentCache> content_cache)
    : orchestrator_(orchestrator),
      tracker_(tracker),
      search_service_(search_service),
      embedding_store_(embedding_store),
      content_cache_(content_cache) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/jobs").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_start_job(req);
  });

  CROW_ROUTE(app, "/jobs/<string>/progress")
  ([this](const crow::request &req, const std::string &owner) {
    return handle_get_progress(req, owner);
  });

  CROW_ROUTE(app, "/jobs/<string>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &owner) {
        return handle_cancel_job(req, owner);
      });

  CROW_ROUTE(app, "/jobs/<string>/reset")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &owner) {
        return handle_reset_job(req, owner);
      });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/search/reference")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_search_reference(req); });

  CROW_ROUTE(app, "/owners/<string>/stats")
  ([this](const crow::request &req, const std::string &owner) {
    return handle_owner_stats(req, owner);
  });

  CROW_ROUTE(app, "/owners/<string>/reconcile")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &owner) {
        return handle_reconcile(req, owner);
      });

  CROW_ROUTE(app, "/owners/<string>/cache/reset")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &owner) {
        return handle_cache_reset(req, owner);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("FaceFind API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["remote_tier"] = embedding_store_->has_remote();
  return create_json_response(response);
}

crow::response Routes::handle_start_job(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string owner = body.value("owner", "");
    const std::string folder = body.value("folder", "");
    const bool force_reprocess = body.value("force_reprocess", false);
    if (owner.empty() || folder.empty()) {
      return create_json_response(create_error_response("owner and folder are required"), 400);
    }

    facefind_core::JobSnapshot snapshot = orchestrator_->start_job(owner, folder, force_reprocess);
    nlohmann::json response = create_success_response("Processing job started", to_json(snapshot));
    return create_json_response(response, 202);
  } catch (const facefind_core::JobAlreadyRunningError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_start_job: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_progress(const crow::request &req, const std::string &owner) {
  facefind_core::JobSnapshot snapshot = tracker_->snapshot(owner);
  return create_json_response(create_success_response("Job progress", to_json(snapshot)));
}

crow::response Routes::handle_cancel_job(const crow::request &req, const std::string &owner) {
  if (!tracker_->cancel(owner)) {
    return create_json_response(create_error_response("No running job for owner " + owner), 404);
  }
  return create_json_response(create_success_response("Cancellation requested"));
}

crow::response Routes::handle_reset_job(const crow::request &req, const std::string &owner) {
  try {
    bool removed = tracker_->reset(owner);
    nlohmann::json response = create_success_response(removed ? "Job state cleared"
                                                              : "No job state to clear");
    return create_json_response(response);
  } catch (const facefind_core::JobAlreadyRunningError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string owner = body.value("owner", "");
    if (owner.empty()) {
      return create_json_response(create_error_response("owner is required"), 400);
    }
    facefind_core::SearchQuery query = parse_search_request(body);
    facefind_core::SearchResult result = search_service_->search(owner, query);
    std::cout << "Search for " << owner << " returned " << result.matches.size() << " matches"
              << std::endl;
    return create_json_response(create_success_response("Search complete", to_json(result)));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const facefind_core::SearchServiceError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const facefind_core::RemoteStoreError &e) {
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search_reference(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string owner = body.value("owner", "");
    const std::string image_b64 = body.value("image", "");
    if (owner.empty() || image_b64.empty()) {
      return create_json_response(create_error_response("owner and image are required"), 400);
    }

    const std::string decoded = crow::utility::base64decode(image_b64, image_b64.size());
    std::vector<unsigned char> image(decoded.begin(), decoded.end());

    facefind_core::ThresholdTier tier = facefind_core::ThresholdTier::Standard;
    if (body.contains("tier")) {
      tier = facefind_core::threshold_tier_from_string(body["tier"].get<std::string>());
    }
    std::optional<float> threshold;
    if (body.contains("threshold") && !body["threshold"].is_null()) {
      threshold = body["threshold"].get<float>();
    }
    std::optional<size_t> limit;
    if (body.contains("limit") && !body["limit"].is_null()) {
      const int requested = body["limit"].get<int>();
      if (requested <= 0) {
        return create_json_response(create_error_response("limit must be positive"), 400);
      }
      limit = static_cast<size_t>(requested);
    }

    facefind_core::SearchResult result =
        search_service_->search_by_image(owner, image, tier, threshold, limit);
    return create_json_response(create_success_response("Search complete", to_json(result)));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const facefind_core::SearchServiceError &e) {
    return create_json_response(create_error_response(e.what()), 422);
  } catch (const facefind_core::EmbeddingProducerError &e) {
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const facefind_core::RemoteStoreError &e) {
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search_reference: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_owner_stats(const crow::request &req, const std::string &owner) {
  try {
    nlohmann::json stats =
        stats_to_json(content_cache_->stats(owner), embedding_store_->stats(owner));
    return create_json_response(create_success_response("Owner statistics", stats));
  } catch (const facefind_core::LocalStoreError &e) {
    std::cerr << "Exception in handle_owner_stats: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_reconcile(const crow::request &req, const std::string &owner) {
  try {
    if (!embedding_store_->has_remote()) {
      return create_json_response(create_error_response("No remote tier configured"), 409);
    }
    facefind_core::ReconcileResult result = embedding_store_->reconcile(owner);
    return create_json_response(create_success_response("Reconciliation finished", to_json(result)));
  } catch (const facefind_core::LocalStoreError &e) {
    std::cerr << "Exception in handle_reconcile: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_cache_reset(const crow::request &req, const std::string &owner) {
  try {
    std::optional<std::string> folder;
    if (!req.body.empty()) {
      nlohmann::json body = parse_json_body(req.body);
      if (body.contains("folder") && body["folder"].is_string()) {
        folder = body["folder"].get<std::string>();
      }
    }
    int removed = orchestrator_->reset_cache(owner, folder);
    nlohmann::json response = create_success_response("Cache reset");
    response["data"]["removed_entries"] = removed;
    return create_json_response(response);
  } catch (const facefind_core::JobAlreadyRunningError &) {
    return create_json_response(
        create_error_response("Cannot reset the cache while a job is running"), 409);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const facefind_core::LocalStoreError &e) {
    std::cerr << "Exception in handle_cache_reset: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace facefind_api

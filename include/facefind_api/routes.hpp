#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace facefind_core {
class ProcessingOrchestrator;
class JobTracker;
class SearchService;
class EmbeddingStore;
class ContentCache;
}  // namespace facefind_core

namespace facefind_api {

class Routes {
 public:
  Routes(std::shared_ptr<facefind_core::ProcessingOrchestrator> orchestrator,
         std::shared_ptr<facefind_core::JobTracker> tracker,
         std::shared_ptr<facefind_core::SearchService> search_service,
         std::shared_ptr<facefind_core::EmbeddingStore> embedding_store,
         std::shared_ptr<facefind_core::ContentCache> content_cache);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

 private:
  std::shared_ptr<facefind_core::ProcessingOrchestrator> orchestrator_;
  std::shared_ptr<facefind_core::JobTracker> tracker_;
  std::shared_ptr<facefind_core::SearchService> search_service_;
  std::shared_ptr<facefind_core::EmbeddingStore> embedding_store_;
  std::shared_ptr<facefind_core::ContentCache> content_cache_;

  crow::response handle_health_check(const crow::request &req);

  // Jobs
  crow::response handle_start_job(const crow::request &req);
  crow::response handle_get_progress(const crow::request &req, const std::string &owner);
  crow::response handle_cancel_job(const crow::request &req, const std::string &owner);
  crow::response handle_reset_job(const crow::request &req, const std::string &owner);

  // Search
  crow::response handle_search(const crow::request &req);
  crow::response handle_search_reference(const crow::request &req);

  // Owner maintenance
  crow::response handle_owner_stats(const crow::request &req, const std::string &owner);
  crow::response handle_reconcile(const crow::request &req, const std::string &owner);
  crow::response handle_cache_reset(const crow::request &req, const std::string &owner);

  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace facefind_api

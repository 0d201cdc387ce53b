#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "facefind_api/config.hpp"
#include "facefind_api/routes.hpp"
#include "facefind_api/server.hpp"
#include "facefind_core/async/deadline.hpp"
#include "facefind_core/async/service_provider.hpp"
#include "facefind_core/async/work_queue.hpp"
#include "facefind_core/async/worker_pool.hpp"
#include "facefind_core/db/cache_manifest_repo.hpp"
#include "facefind_core/db/database_manager.hpp"
#include "facefind_core/db/folder_snapshot_repo.hpp"
#include "facefind_core/db/local_embedding_repo.hpp"
#include "facefind_core/progress/job_tracker.hpp"
#include "facefind_core/recognition/http_embedding_producer.hpp"
#include "facefind_core/remote/rest_remote_embedding_store.hpp"
#include "facefind_core/services/content_cache.hpp"
#include "facefind_core/services/embedding_store.hpp"
#include "facefind_core/services/processing_orchestrator.hpp"
#include "facefind_core/services/search_service.hpp"
#include "facefind_core/sources/http_photo_source.hpp"
#include "facefind_core/sources/local_folder_source.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

std::shared_ptr<facefind_core::PhotoSource> make_photo_source(const Config& config) {
  if (config.source_type == "http") {
    return std::make_shared<facefind_core::HttpPhotoSource>(config.source_url, config.source_token,
                                                           config.remote_timeout_seconds * 2);
  }
  return std::make_shared<facefind_core::LocalFolderSource>(config.source_root);
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "facefindrc.json";
    Config config = Config::from_file(config_path);
    if (config.db_key.empty()) {
      throw std::runtime_error("No database key: set FACEFIND_DB_KEY or db_key in " + config_path);
    }

    std::cout << "Starting FaceFind API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Local DB Path: " << config.local_db_path << std::endl;
    std::cout << "Cache Root: " << config.cache_root << std::endl;
    std::cout << "Recognition URL: " << config.recognition_url << " (" << config.recognition_model
              << ")" << std::endl;
    std::cout << "Remote Tier: "
              << (config.remote_enabled() ? config.remote_store_url : std::string("disabled"))
              << std::endl;
    std::cout << "Photo Source: " << config.source_type << std::endl;
    std::cout << "Workers: " << config.num_workers << std::endl;

    // --- 1. CORE COMPONENTS ---
    auto& db_manager = facefind_core::DatabaseManager::get_instance();
    db_manager.initialize(config.local_db_path, config.db_key, config.db_pool_size);

    auto manifest = std::make_shared<facefind_core::CacheManifestRepo>(db_manager);
    auto local_repo = std::make_shared<facefind_core::LocalEmbeddingRepo>(db_manager);
    auto snapshots = std::make_shared<facefind_core::FolderSnapshotRepo>(db_manager);

    facefind_core::ContentCacheOptions cache_options;
    cache_options.root = config.cache_root;
    cache_options.download_attempts = config.download_attempts;
    cache_options.retry_backoff = std::chrono::milliseconds(config.download_retry_backoff_ms);
    auto content_cache = std::make_shared<facefind_core::ContentCache>(manifest, cache_options);

    std::shared_ptr<facefind_core::RemoteEmbeddingStore> remote_store;
    if (config.remote_enabled()) {
      remote_store = std::make_shared<facefind_core::RestRemoteEmbeddingStore>(
          config.remote_store_url, config.remote_store_api_key, config.remote_timeout_seconds,
          static_cast<size_t>(config.remote_page_size));
    }
    auto embedding_store = std::make_shared<facefind_core::EmbeddingStore>(local_repo, remote_store);

    auto producer = std::make_shared<facefind_core::HttpEmbeddingProducer>(
        config.recognition_url, config.recognition_model, config.recognition_timeout_seconds);
    auto search_service = std::make_shared<facefind_core::SearchService>(
        embedding_store, producer, facefind_core::ThresholdPolicy(config.thresholds),
        config.warm_local_on_remote_fallback);

    auto work_queue = std::make_shared<facefind_core::async::WorkQueue>();
    // Timed-out calls keep their slot, so in-flight calls never exceed the worker count
    auto call_slots =
        std::make_shared<facefind_core::async::CallSlots>(static_cast<size_t>(config.num_workers));
    auto services = std::make_shared<facefind_core::ServiceProvider>(
        content_cache, embedding_store, producer, make_photo_source(config), work_queue,
        call_slots);
    auto worker_pool = std::make_unique<facefind_core::async::WorkerPool>(
        static_cast<size_t>(config.num_workers), services);

    facefind_core::OrchestratorOptions orchestrator_options;
    orchestrator_options.filter.skip_system_files = config.skip_system_files;
    orchestrator_options.filter.image_extensions = config.image_extensions;
    orchestrator_options.item_timeout = std::chrono::seconds(config.item_timeout_seconds);
    orchestrator_options.worker_count = static_cast<size_t>(config.num_workers);
    auto tracker = std::make_shared<facefind_core::JobTracker>();
    auto orchestrator = std::make_shared<facefind_core::ProcessingOrchestrator>(
        services, tracker, snapshots, orchestrator_options);

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    facefind_api::Server server(host, port, static_cast<unsigned int>(config.http_threads));
    facefind_api::Routes routes(orchestrator, tracker, search_service, embedding_store,
                                content_cache);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    server.get_app().signal_clear();
    worker_pool->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Cancelling running jobs..." << std::endl;
    orchestrator->shutdown();

    std::cout << "[3/4] Stopping worker pool..." << std::endl;
    work_queue->close();
    worker_pool->stop();
    worker_pool.reset();

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

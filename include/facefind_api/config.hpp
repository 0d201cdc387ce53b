#pragma once

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "facefind_core/services/threshold_policy.hpp"

class Config {
 public:
  std::string api_base_url;
  // 0 lets the HTTP server pick one thread per core
  int http_threads;
  std::string local_db_path;
  std::string db_key;
  std::string cache_root;
  int num_workers;
  int db_pool_size;
  int item_timeout_seconds;
  int download_attempts;
  int download_retry_backoff_ms;

  // Recognition engine
  std::string recognition_url;
  std::string recognition_model;
  int recognition_timeout_seconds;

  // Remote tier; disabled when remote_store_url is empty
  std::string remote_store_url;
  std::string remote_store_api_key;
  int remote_timeout_seconds;
  int remote_page_size;

  // Photo source: "local" (a directory) or "http" (listing API)
  std::string source_type;
  std::string source_root;
  std::string source_url;
  std::string source_token;
  bool skip_system_files;
  std::vector<std::string> image_extensions;

  facefind_core::ThresholdTable thresholds;
  bool warm_local_on_remote_fallback;

  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // The database key comes from FACEFIND_DB_KEY when set, otherwise from "db_key".
  // A key holding a value of the wrong type falls back to its default.
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = value_or_default(json_config, "api_base_url", std::string("127.0.0.1:3030"));
    config.http_threads = value_or_default(json_config, "http_threads", 0);
    config.local_db_path = value_or_default(json_config, "local_db_path", std::string("./data/facefind.db"));
    config.db_key = value_or_default(json_config, "db_key", std::string(""));
    if (const char* env_key = std::getenv("FACEFIND_DB_KEY"); env_key && *env_key) {
      config.db_key = env_key;
    }
    config.cache_root = value_or_default(json_config, "cache_root", std::string("./data/cache"));

    config.num_workers = value_or_default(json_config, "num_workers", 4);
    config.db_pool_size = value_or_default(json_config, "db_pool_size", config.num_workers + 2);
    config.item_timeout_seconds = value_or_default(json_config, "item_timeout_seconds", 120);
    config.download_attempts = value_or_default(json_config, "download_attempts", 3);
    config.download_retry_backoff_ms = value_or_default(json_config, "download_retry_backoff_ms", 500);

    config.recognition_url = value_or_default(
        json_config, "recognition_url", std::string("http://localhost:8001/v1/faces/embed"));
    config.recognition_model =
        value_or_default(json_config, "recognition_model", std::string("arcface-r100"));
    config.recognition_timeout_seconds =
        value_or_default(json_config, "recognition_timeout_seconds", 60);

    config.remote_store_url = value_or_default(json_config, "remote_store_url", std::string(""));
    config.remote_store_api_key =
        value_or_default(json_config, "remote_store_api_key", std::string(""));
    config.remote_timeout_seconds = value_or_default(json_config, "remote_timeout_seconds", 30);
    config.remote_page_size = value_or_default(json_config, "remote_page_size", 1000);

    config.source_type = value_or_default(json_config, "source_type", std::string("local"));
    config.source_root = value_or_default(json_config, "source_root", std::string("./data/photos"));
    config.source_url = value_or_default(json_config, "source_url", std::string(""));
    config.source_token = value_or_default(json_config, "source_token", std::string(""));
    config.skip_system_files = value_or_default(json_config, "skip_system_files", true);
    config.image_extensions = value_or_default(
        json_config, "image_extensions", std::vector<std::string>{".jpg", ".jpeg", ".png", ".webp"});

    if (json_config.contains("thresholds") && json_config["thresholds"].is_object()) {
      const auto& t = json_config["thresholds"];
      config.thresholds.strict = value_or_default(t, "strict", config.thresholds.strict);
      config.thresholds.standard = value_or_default(t, "standard", config.thresholds.standard);
      config.thresholds.loose = value_or_default(t, "loose", config.thresholds.loose);
    }
    config.warm_local_on_remote_fallback =
        value_or_default(json_config, "warm_local_on_remote_fallback", true);

    config.validate();
    return config;
  }

  bool remote_enabled() const {
    return !remote_store_url.empty();
  }

 private:
  template <typename T>
  static T value_or_default(const nlohmann::json& json_config, const char* key, T fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    try {
      return json_config.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
      std::cerr << "Config: ignoring '" << key << "' (" << e.what() << "), using the default"
                << std::endl;
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (http_threads < 0 || http_threads > 1024) {
      throw std::runtime_error("http_threads must be between 0 and 1024");
    }
    if (local_db_path.empty()) {
      throw std::runtime_error("local_db_path cannot be empty");
    }
    if (cache_root.empty()) {
      throw std::runtime_error("cache_root cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (item_timeout_seconds <= 0) {
      throw std::runtime_error("item_timeout_seconds must be greater than 0");
    }
    if (download_attempts < 1) {
      throw std::runtime_error("download_attempts must be at least 1");
    }
    if (download_retry_backoff_ms < 0) {
      throw std::runtime_error("download_retry_backoff_ms cannot be negative");
    }
    if (recognition_url.empty()) {
      throw std::runtime_error("recognition_url cannot be empty");
    }
    if (remote_page_size <= 0) {
      throw std::runtime_error("remote_page_size must be greater than 0");
    }
    if (remote_enabled() && remote_store_api_key.empty()) {
      throw std::runtime_error("remote_store_api_key is required when remote_store_url is set");
    }
    if (source_type == "local") {
      if (source_root.empty()) {
        throw std::runtime_error("source_root cannot be empty for a local source");
      }
    } else if (source_type == "http") {
      if (source_url.empty()) {
        throw std::runtime_error("source_url cannot be empty for an http source");
      }
    } else {
      throw std::runtime_error("source_type must be 'local' or 'http'");
    }
    // Throws std::invalid_argument on a non-monotonic table
    try {
      facefind_core::ThresholdPolicy policy(thresholds);
      (void)policy;
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(std::string("thresholds: ") + e.what());
    }
  }
};

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "facefind_core/db/cache_manifest_repo.hpp"
#include "facefind_core/sources/photo_source.hpp"
#include "facefind_core/types/source_file.hpp"

namespace facefind_core {

class ContentCacheError : public std::exception {
 public:
  explicit ContentCacheError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ContentCacheOptions {
  std::filesystem::path root = "./data/cache";
  int download_attempts = 3;
  std::chrono::milliseconds retry_backoff{500};
};

/**
 * @class ContentCache
 * @brief Local copies of source files, published atomically.
 *
 * Downloads land in `<root>/.partial` and are renamed into place before the
 * manifest row is written, so a manifest entry always points at a complete
 * file. Entries are only removed by evict() or reset().
 */
class ContentCache {
 public:
  ContentCache(std::shared_ptr<CacheManifestRepo> manifest, ContentCacheOptions options);

  // Manifest lookup only; never touches the network or the file system.
  bool exists(const std::string& owner, const std::string& scope, const std::string& file_id);

  std::optional<CacheEntry> lookup(const std::string& owner,
                                   const std::string& scope,
                                   const std::string& file_id);

  // Returns the cached path, downloading first when there is no valid entry.
  // A corrupt entry (file missing or size changed) is refetched transparently.
  std::filesystem::path fetch(const std::string& owner,
                              const std::string& scope,
                              const SourceFile& file,
                              PhotoSource& source);

  std::filesystem::path force_refetch(const std::string& owner,
                                      const std::string& scope,
                                      const SourceFile& file,
                                      PhotoSource& source);

  bool evict(const std::string& owner, const std::string& scope, const std::string& file_id);
  int reset(const std::string& owner, const std::optional<std::string>& scope = std::nullopt);

  CacheStats stats(const std::string& owner);

  static std::vector<unsigned char> read_file(const std::filesystem::path& path);

  const std::filesystem::path& root() const {
    return options_.root;
  }

 private:
  std::filesystem::path download_and_publish(const std::string& owner,
                                             const std::string& scope,
                                             const SourceFile& file,
                                             PhotoSource& source);
  std::filesystem::path entry_path(const std::string& owner,
                                   const std::string& scope,
                                   const SourceFile& file) const;
  std::filesystem::path next_partial_path();
  static bool is_intact(const CacheEntry& entry);

  std::shared_ptr<CacheManifestRepo> manifest_;
  ContentCacheOptions options_;
  std::atomic<uint64_t> partial_counter_{0};
};

}  // namespace facefind_core

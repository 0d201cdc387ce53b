#include "facefind_core/services/content_cache.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iostream>
#include <thread>

#include "facefind_core/net/http_client.hpp"
#include "facefind_core/util/digest.hpp"

namespace facefind_core {

ContentCache::ContentCache(std::shared_ptr<CacheManifestRepo> manifest, ContentCacheOptions options)
    : manifest_(std::move(manifest)), options_(std::move(options)) {
  if (options_.download_attempts < 1) {
    throw std::invalid_argument("ContentCache needs at least one download attempt.");
  }
  std::filesystem::create_directories(options_.root / ".partial");
}

bool ContentCache::exists(const std::string& owner,
                          const std::string& scope,
                          const std::string& file_id) {
  return manifest_->find(owner, scope, file_id).has_value();
}

std::optional<CacheEntry> ContentCache::lookup(const std::string& owner,
                                               const std::string& scope,
                                               const std::string& file_id) {
  return manifest_->find(owner, scope, file_id);
}

std::filesystem::path ContentCache::fetch(const std::string& owner,
                                          const std::string& scope,
                                          const SourceFile& file,
                                          PhotoSource& source) {
  std::optional<CacheEntry> entry = manifest_->find(owner, scope, file.id);
  if (entry) {
    if (is_intact(*entry)) {
      return entry->local_path;
    }
    std::cerr << "ContentCache: entry for " << scope << "/" << file.id
              << " is corrupt, refetching." << std::endl;
  }
  return download_and_publish(owner, scope, file, source);
}

std::filesystem::path ContentCache::force_refetch(const std::string& owner,
                                                  const std::string& scope,
                                                  const SourceFile& file,
                                                  PhotoSource& source) {
  return download_and_publish(owner, scope, file, source);
}

bool ContentCache::evict(const std::string& owner,
                         const std::string& scope,
                         const std::string& file_id) {
  std::optional<CacheEntry> entry = manifest_->find(owner, scope, file_id);
  if (!entry) {
    return false;
  }
  // Manifest first: an entry must never outlive its file
  bool removed = manifest_->remove(owner, scope, file_id);
  std::error_code ec;
  std::filesystem::remove(entry->local_path, ec);
  if (ec) {
    std::cerr << "ContentCache: failed to delete " << entry->local_path << ": " << ec.message()
              << std::endl;
  }
  return removed;
}

int ContentCache::reset(const std::string& owner, const std::optional<std::string>& scope) {
  std::vector<CacheEntry> entries = manifest_->list(owner, scope);
  int removed = manifest_->remove_all(owner, scope);
  for (const auto& entry : entries) {
    std::error_code ec;
    std::filesystem::remove(entry.local_path, ec);
    if (ec) {
      std::cerr << "ContentCache: failed to delete " << entry.local_path << ": " << ec.message()
                << std::endl;
    }
  }
  return removed;
}

CacheStats ContentCache::stats(const std::string& owner) {
  return manifest_->stats(owner);
}

std::vector<unsigned char> ContentCache::read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw ContentCacheError("Failed to open cached file: " + path.string());
  }
  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw ContentCacheError("Failed to read cached file: " + path.string());
  }
  return bytes;
}

bool ContentCache::is_intact(const CacheEntry& entry) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(entry.local_path, ec);
  return !ec && size == entry.byte_size;
}

std::filesystem::path ContentCache::entry_path(const std::string& owner,
                                               const std::string& scope,
                                               const SourceFile& file) const {
  std::string extension = std::filesystem::path(file.display_name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return options_.root / sha256_hex(owner).substr(0, 16) / sha256_hex(scope).substr(0, 16) /
         (sha256_hex(file.id) + extension);
}

std::filesystem::path ContentCache::next_partial_path() {
  const uint64_t sequence = partial_counter_.fetch_add(1);
  const size_t thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return options_.root / ".partial" /
         (std::to_string(thread_tag) + "-" + std::to_string(sequence) + ".part");
}

std::filesystem::path ContentCache::download_and_publish(const std::string& owner,
                                                         const std::string& scope,
                                                         const SourceFile& file,
                                                         PhotoSource& source) {
  const std::filesystem::path final_path = entry_path(owner, scope, file);
  std::string last_error;

  for (int attempt = 1; attempt <= options_.download_attempts; ++attempt) {
    const std::filesystem::path partial = next_partial_path();
    try {
      {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
          throw ContentCacheError("Failed to create " + partial.string());
        }
        source.download(scope, file, out);
        out.flush();
        if (!out.good()) {
          throw ContentCacheError("Failed to write " + partial.string());
        }
      }

      const uint64_t written = std::filesystem::file_size(partial);
      if (file.byte_size > 0 && written != file.byte_size) {
        throw ContentCacheError("Truncated download: expected " + std::to_string(file.byte_size) +
                                " bytes, got " + std::to_string(written));
      }

      std::filesystem::create_directories(final_path.parent_path());
      std::filesystem::rename(partial, final_path);

      CacheEntry entry;
      entry.owner = owner;
      entry.source_scope = scope;
      entry.source_file_id = file.id;
      entry.local_path = final_path.string();
      entry.display_name = file.display_name;
      entry.byte_size = written;
      entry.modified_marker = file.modified_marker;
      entry.created_at = std::chrono::system_clock::now();
      manifest_->publish(entry);
      return final_path;
    } catch (const PhotoSourceError& e) {
      last_error = e.what();
    } catch (const HttpError& e) {
      last_error = e.what();
    } catch (const ContentCacheError& e) {
      last_error = e.what();
    } catch (const std::filesystem::filesystem_error& e) {
      last_error = e.what();
    }

    std::error_code ec;
    std::filesystem::remove(partial, ec);
    std::cerr << "ContentCache: attempt " << attempt << "/" << options_.download_attempts
              << " for " << scope << "/" << file.id << " failed: " << last_error << std::endl;
    if (attempt < options_.download_attempts && options_.retry_backoff.count() > 0) {
      std::this_thread::sleep_for(options_.retry_backoff * attempt);
    }
  }

  throw ContentCacheError("Failed to fetch " + scope + "/" + file.id + " after " +
                          std::to_string(options_.download_attempts) +
                          " attempts: " + last_error);
}

}  // namespace facefind_core

#pragma once

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "facefind_core/db/local_embedding_repo.hpp"
#include "facefind_core/recognition/embedding_producer.hpp"
#include "facefind_core/remote/remote_embedding_store.hpp"
#include "facefind_core/sources/photo_source.hpp"

namespace facefind_tests {

/**
 * Mock class for the recognition engine
 */
class MockEmbeddingProducer : public facefind_core::EmbeddingProducer {
 public:
  MOCK_METHOD(std::vector<std::vector<float>>, detect_and_embed,
              (const std::vector<unsigned char>& image_bytes), (override));
};

/**
 * Local tier whose writes can be scripted; reads go to the real database.
 */
class MockLocalEmbeddingRepo : public facefind_core::LocalEmbeddingRepo {
 public:
  explicit MockLocalEmbeddingRepo(facefind_core::DatabaseManager& db_manager)
      : facefind_core::LocalEmbeddingRepo(db_manager) {}

  MOCK_METHOD(void, replace_photo,
              (const std::string& owner, const std::string& photo_reference,
               const std::vector<facefind_core::FaceEmbedding>& faces, bool remote_synced),
              (override));
};

/**
 * In-memory photo source. Each file's content is an arbitrary string;
 * failures can be injected per file id.
 */
class FakePhotoSource : public facefind_core::PhotoSource {
 public:
  facefind_core::SourceFile add_file(const std::string& folder,
                                     const std::string& id,
                                     const std::string& content,
                                     const std::string& marker = "m1") {
    std::lock_guard<std::mutex> lock(mtx_);
    facefind_core::SourceFile file;
    file.id = id;
    file.display_name = id;
    file.byte_size = content.size();
    file.modified_marker = marker;
    auto& files = folders_[folder];
    for (auto& existing : files) {
      if (existing.file.id == id) {
        existing = Entry{file, content};
        return file;
      }
    }
    files.push_back(Entry{file, content});
    return file;
  }

  void remove_file(const std::string& folder, const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& files = folders_[folder];
    for (auto it = files.begin(); it != files.end(); ++it) {
      if (it->file.id == id) {
        files.erase(it);
        return;
      }
    }
  }

  std::vector<facefind_core::SourceFile> list_files(const std::string& folder) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++list_calls_;
    if (fail_listing_) {
      throw facefind_core::PhotoSourceError("listing unavailable for " + folder);
    }
    std::vector<facefind_core::SourceFile> result;
    for (const auto& entry : folders_[folder]) {
      result.push_back(entry.file);
    }
    return result;
  }

  void download(const std::string& folder,
                const facefind_core::SourceFile& file,
                std::ostream& out) override {
    std::string content;
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++download_counts_[file.id];
      auto slow = download_delays_.find(file.id);
      if (slow != download_delays_.end()) {
        delay = slow->second;
      }
      auto remaining = transient_failures_.find(file.id);
      if (remaining != transient_failures_.end() && remaining->second > 0) {
        --remaining->second;
        throw facefind_core::PhotoSourceError("transient failure for " + file.id);
      }
      if (failing_ids_.count(file.id)) {
        throw facefind_core::PhotoSourceError("download failed for " + file.id);
      }
      bool found = false;
      for (const auto& entry : folders_[folder]) {
        if (entry.file.id == file.id) {
          content = entry.content;
          found = true;
        }
      }
      if (!found) {
        throw facefind_core::PhotoSourceError("no such file " + file.id);
      }
      if (truncated_ids_.count(file.id)) {
        content = content.substr(0, content.size() / 2);
      }
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    out << content;
  }

  void delay_downloads_of(const std::string& id, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mtx_);
    download_delays_[id] = delay;
  }

  void fail_downloads_of(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    failing_ids_.insert(id);
  }

  void fail_next_downloads_of(const std::string& id, int times) {
    std::lock_guard<std::mutex> lock(mtx_);
    transient_failures_[id] = times;
  }

  void truncate_downloads_of(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    truncated_ids_.insert(id);
  }

  void clear_failures() {
    std::lock_guard<std::mutex> lock(mtx_);
    failing_ids_.clear();
    transient_failures_.clear();
    truncated_ids_.clear();
  }

  void set_fail_listing(bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_listing_ = fail;
  }

  int download_count(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return download_counts_[id];
  }

  int total_downloads() {
    std::lock_guard<std::mutex> lock(mtx_);
    int total = 0;
    for (const auto& [id, count] : download_counts_) {
      total += count;
    }
    return total;
  }

  int list_calls() {
    std::lock_guard<std::mutex> lock(mtx_);
    return list_calls_;
  }

 private:
  struct Entry {
    facefind_core::SourceFile file;
    std::string content;
  };

  std::mutex mtx_;
  std::map<std::string, std::vector<Entry>> folders_;
  std::set<std::string> failing_ids_;
  std::set<std::string> truncated_ids_;
  std::map<std::string, int> transient_failures_;
  std::map<std::string, int> download_counts_;
  std::map<std::string, std::chrono::milliseconds> download_delays_;
  bool fail_listing_ = false;
  int list_calls_ = 0;
};

/**
 * Recognition engine driven by image content: each known content string maps
 * to a fixed face set. Unknown content has no faces.
 */
class ScriptedEmbeddingProducer : public facefind_core::EmbeddingProducer {
 public:
  void set_faces(const std::string& content, std::vector<std::vector<float>> faces) {
    std::lock_guard<std::mutex> lock(mtx_);
    faces_[content] = std::move(faces);
  }

  void fail_on(const std::string& content) {
    std::lock_guard<std::mutex> lock(mtx_);
    failing_.insert(content);
  }

  void clear_failures() {
    std::lock_guard<std::mutex> lock(mtx_);
    failing_.clear();
  }

  void delay_on(const std::string& content, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mtx_);
    delays_[content] = delay;
  }

  std::vector<std::vector<float>> detect_and_embed(
      const std::vector<unsigned char>& image_bytes) override {
    const std::string content(image_bytes.begin(), image_bytes.end());
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++calls_[content];
      if (failing_.count(content)) {
        throw facefind_core::EmbeddingProducerError("engine rejected image");
      }
      auto it = delays_.find(content);
      if (it != delays_.end()) {
        delay = it->second;
      }
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = faces_.find(content);
    return it == faces_.end() ? std::vector<std::vector<float>>{} : it->second;
  }

  int calls_for(const std::string& content) {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_[content];
  }

  int total_calls() {
    std::lock_guard<std::mutex> lock(mtx_);
    int total = 0;
    for (const auto& [content, count] : calls_) {
      total += count;
    }
    return total;
  }

 private:
  std::mutex mtx_;
  std::map<std::string, std::vector<std::vector<float>>> faces_;
  std::set<std::string> failing_;
  std::map<std::string, std::chrono::milliseconds> delays_;
  std::map<std::string, int> calls_;
};

/**
 * In-memory remote tier with switchable failures
 */
class FakeRemoteEmbeddingStore : public facefind_core::RemoteEmbeddingStore {
 public:
  void replace_photo(const std::string& owner,
                     const std::string& photo_reference,
                     const std::vector<facefind_core::FaceEmbedding>& faces) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++write_calls_;
    if (fail_writes_) {
      throw facefind_core::RemoteStoreError("remote tier unavailable");
    }
    photos_[owner][photo_reference] = faces;
  }

  std::optional<std::vector<facefind_core::FaceEmbedding>> get_photo(
      const std::string& owner, const std::string& photo_reference) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++read_calls_;
    if (fail_reads_) {
      throw facefind_core::RemoteStoreError("remote tier unavailable");
    }
    auto owner_it = photos_.find(owner);
    if (owner_it == photos_.end()) {
      return std::nullopt;
    }
    auto it = owner_it->second.find(photo_reference);
    if (it == owner_it->second.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<facefind_core::PhotoFaces> get_all(const std::string& owner) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++read_calls_;
    if (fail_reads_) {
      throw facefind_core::RemoteStoreError("remote tier unavailable");
    }
    std::vector<facefind_core::PhotoFaces> result;
    for (const auto& [reference, faces] : photos_[owner]) {
      result.push_back(facefind_core::PhotoFaces{reference, faces});
    }
    return result;
  }

  void set_fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_writes_ = fail;
  }

  void set_fail_reads(bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_reads_ = fail;
  }

  size_t photo_count(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mtx_);
    return photos_[owner].size();
  }

  size_t face_count(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t total = 0;
    for (const auto& [reference, faces] : photos_[owner]) {
      total += faces.size();
    }
    return total;
  }

  int write_calls() {
    std::lock_guard<std::mutex> lock(mtx_);
    return write_calls_;
  }

  int read_calls() {
    std::lock_guard<std::mutex> lock(mtx_);
    return read_calls_;
  }

 private:
  std::mutex mtx_;
  std::map<std::string, std::map<std::string, std::vector<facefind_core::FaceEmbedding>>> photos_;
  bool fail_writes_ = false;
  bool fail_reads_ = false;
  int write_calls_ = 0;
  int read_calls_ = 0;
};

}  // namespace facefind_tests

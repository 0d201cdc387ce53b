#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "facefind_core/services/content_cache.hpp"

namespace facefind_tests {

using facefind_core::ContentCache;
using facefind_core::ContentCacheError;

class ContentCacheTest : public LocalStoreTestBase {
 protected:
  void SetUp() override {
    LocalStoreTestBase::SetUp();
    cache_root_ = TestUtilities::create_temp_dir("facefind_cache");
    facefind_core::ContentCacheOptions options;
    options.root = cache_root_;
    options.download_attempts = 3;
    options.retry_backoff = std::chrono::milliseconds(0);
    cache_ = std::make_shared<ContentCache>(manifest_repo_, options);
  }

  void TearDown() override {
    cache_.reset();
    TestUtilities::remove_temp_dir(cache_root_);
    LocalStoreTestBase::TearDown();
  }

  static std::string read_text(const std::filesystem::path& path) {
    auto bytes = ContentCache::read_file(path);
    return std::string(bytes.begin(), bytes.end());
  }

  size_t partial_files() const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(cache_root_ / ".partial")) {
      (void)entry;
      ++count;
    }
    return count;
  }

  std::filesystem::path cache_root_;
  std::shared_ptr<ContentCache> cache_;
  FakePhotoSource source_;
};

TEST_F(ContentCacheTest, Exists_FalseBeforeFetchTrueAfter) {
  auto file = source_.add_file("trip", "a.jpg", "image-a");
  EXPECT_FALSE(cache_->exists("alice", "trip", "a.jpg"));

  auto path = cache_->fetch("alice", "trip", file, source_);

  EXPECT_TRUE(cache_->exists("alice", "trip", "a.jpg"));
  EXPECT_EQ(read_text(path), "image-a");
  EXPECT_FALSE(cache_->exists("bob", "trip", "a.jpg"));
}

TEST_F(ContentCacheTest, Fetch_SecondCallServedFromCache) {
  auto file = source_.add_file("trip", "a.jpg", "image-a");

  auto first = cache_->fetch("alice", "trip", file, source_);
  auto second = cache_->fetch("alice", "trip", file, source_);

  EXPECT_EQ(first, second);
  EXPECT_EQ(source_.download_count("a.jpg"), 1);
}

TEST_F(ContentCacheTest, ForceRefetch_AlwaysDownloadsAndReplacesContent) {
  auto file = source_.add_file("trip", "a.jpg", "old-bytes");
  cache_->fetch("alice", "trip", file, source_);
  auto updated = source_.add_file("trip", "a.jpg", "new-content", "m2");

  auto path = cache_->force_refetch("alice", "trip", updated, source_);

  EXPECT_EQ(source_.download_count("a.jpg"), 2);
  EXPECT_EQ(read_text(path), "new-content");
  auto entry = cache_->lookup("alice", "trip", "a.jpg");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->modified_marker, "m2");
  EXPECT_EQ(entry->byte_size, updated.byte_size);
}

TEST_F(ContentCacheTest, Fetch_FailedDownloadLeavesNoEntryAndNoPartial) {
  auto file = source_.add_file("trip", "broken.jpg", "bytes");
  source_.fail_downloads_of("broken.jpg");

  EXPECT_THROW(cache_->fetch("alice", "trip", file, source_), ContentCacheError);

  EXPECT_FALSE(cache_->exists("alice", "trip", "broken.jpg"));
  EXPECT_EQ(source_.download_count("broken.jpg"), 3);
  EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ContentCacheTest, Fetch_TruncatedDownloadIsNeverPublished) {
  auto file = source_.add_file("trip", "short.jpg", "0123456789");
  source_.truncate_downloads_of("short.jpg");

  EXPECT_THROW(cache_->fetch("alice", "trip", file, source_), ContentCacheError);

  EXPECT_FALSE(cache_->exists("alice", "trip", "short.jpg"));
  EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ContentCacheTest, Fetch_TransientFailureRetriedThenPublished) {
  auto file = source_.add_file("trip", "flaky.jpg", "bytes");
  source_.fail_next_downloads_of("flaky.jpg", 2);

  auto path = cache_->fetch("alice", "trip", file, source_);

  EXPECT_EQ(read_text(path), "bytes");
  EXPECT_EQ(source_.download_count("flaky.jpg"), 3);
}

TEST_F(ContentCacheTest, Fetch_CorruptEntryIsRefetched) {
  auto file = source_.add_file("trip", "a.jpg", "image-a");
  auto path = cache_->fetch("alice", "trip", file, source_);
  std::filesystem::remove(path);

  auto again = cache_->fetch("alice", "trip", file, source_);

  EXPECT_EQ(read_text(again), "image-a");
  EXPECT_EQ(source_.download_count("a.jpg"), 2);
}

TEST_F(ContentCacheTest, Fetch_FailureOfOneFileDoesNotAffectOthers) {
  auto good = source_.add_file("trip", "good.jpg", "good");
  auto bad = source_.add_file("trip", "bad.jpg", "bad");
  source_.fail_downloads_of("bad.jpg");

  EXPECT_THROW(cache_->fetch("alice", "trip", bad, source_), ContentCacheError);
  EXPECT_NO_THROW(cache_->fetch("alice", "trip", good, source_));

  EXPECT_TRUE(cache_->exists("alice", "trip", "good.jpg"));
  EXPECT_FALSE(cache_->exists("alice", "trip", "bad.jpg"));
}

TEST_F(ContentCacheTest, Fetch_ConcurrentFetchesOfSameFileStayConsistent) {
  auto file = source_.add_file("trip", "a.jpg", std::string(4096, 'x'));

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&]() { cache_->force_refetch("alice", "trip", file, source_); });
  }
  for (auto& t : threads) {
    t.join();
  }

  auto entry = cache_->lookup("alice", "trip", "a.jpg");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(std::filesystem::file_size(entry->local_path), 4096u);
  EXPECT_EQ(cache_->stats("alice").entry_count, 1);
}

TEST_F(ContentCacheTest, Reset_RemovesEntriesAndFilesForScope) {
  auto a = source_.add_file("trip", "a.jpg", "a");
  auto b = source_.add_file("home", "b.jpg", "b");
  auto trip_path = cache_->fetch("alice", "trip", a, source_);
  cache_->fetch("alice", "home", b, source_);

  EXPECT_EQ(cache_->reset("alice", std::string("trip")), 1);

  EXPECT_FALSE(std::filesystem::exists(trip_path));
  EXPECT_FALSE(cache_->exists("alice", "trip", "a.jpg"));
  EXPECT_TRUE(cache_->exists("alice", "home", "b.jpg"));
}

TEST_F(ContentCacheTest, Evict_RemovesSingleEntry) {
  auto a = source_.add_file("trip", "a.jpg", "a");
  auto path = cache_->fetch("alice", "trip", a, source_);

  EXPECT_TRUE(cache_->evict("alice", "trip", "a.jpg"));
  EXPECT_FALSE(cache_->evict("alice", "trip", "a.jpg"));
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ContentCacheTest, Constructor_RejectsZeroAttempts) {
  facefind_core::ContentCacheOptions options;
  options.root = cache_root_;
  options.download_attempts = 0;
  EXPECT_THROW(ContentCache(manifest_repo_, options), std::invalid_argument);
}

}  // namespace facefind_tests

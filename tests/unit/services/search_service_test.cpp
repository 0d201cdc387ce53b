#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "facefind_core/services/search_service.hpp"

namespace facefind_tests {

using facefind_core::SearchQuery;
using facefind_core::SearchService;
using facefind_core::SearchServiceError;
using facefind_core::ThresholdTier;
using ::testing::_;
using ::testing::Return;

class SearchServiceTest : public LocalStoreTestBase {
 protected:
  void SetUp() override {
    LocalStoreTestBase::SetUp();
    remote_ = std::make_shared<FakeRemoteEmbeddingStore>();
    store_ = std::make_shared<facefind_core::EmbeddingStore>(local_repo_, remote_);
    producer_ = std::make_shared<MockEmbeddingProducer>();
    service_ = std::make_shared<SearchService>(store_, producer_);
  }

  void add_photo(const std::string& reference, const std::vector<float>& cosines) {
    std::vector<std::vector<float>> faces;
    int toward = 1;
    for (float c : cosines) {
      faces.push_back(TestUtilities::vector_with_cosine(c, 0, toward++));
    }
    store_->put("alice", reference, faces);
  }

  SearchQuery query_for(ThresholdTier tier) {
    SearchQuery query;
    query.embeddings = {TestUtilities::unit_vector(0)};
    query.tier = tier;
    return query;
  }

  static std::vector<std::string> references(const facefind_core::SearchResult& result) {
    std::vector<std::string> refs;
    for (const auto& match : result.matches) {
      refs.push_back(match.photo_reference);
    }
    return refs;
  }

  std::shared_ptr<FakeRemoteEmbeddingStore> remote_;
  std::shared_ptr<facefind_core::EmbeddingStore> store_;
  std::shared_ptr<MockEmbeddingProducer> producer_;
  std::shared_ptr<SearchService> service_;
};

TEST_F(SearchServiceTest, Search_StandardTierRanksMatchesByScore) {
  add_photo("p1.jpg", {0.7f});
  add_photo("p2.jpg", {0.9f});
  add_photo("p3.jpg", {0.3f});

  auto result = service_->search("alice", query_for(ThresholdTier::Standard));

  ASSERT_EQ(result.matches.size(), 2u);
  EXPECT_EQ(result.matches[0].photo_reference, "p2.jpg");
  EXPECT_NEAR(result.matches[0].score, 0.9f, 1e-4);
  EXPECT_EQ(result.matches[1].photo_reference, "p1.jpg");
  EXPECT_NEAR(result.matches[1].score, 0.7f, 1e-4);
  EXPECT_FLOAT_EQ(result.threshold, 0.60f);
  EXPECT_EQ(result.photos_scanned, 3u);
  EXPECT_EQ(result.faces_scanned, 3u);
  EXPECT_FALSE(result.from_remote);
}

TEST_F(SearchServiceTest, Search_PhotoWithSeveralMatchingFacesReportedOnceWithBestScore) {
  add_photo("group.jpg", {0.65f, 0.85f, 0.2f});
  add_photo("solo.jpg", {0.75f});

  auto result = service_->search("alice", query_for(ThresholdTier::Standard));

  ASSERT_EQ(result.matches.size(), 2u);
  EXPECT_EQ(result.matches[0].photo_reference, "group.jpg");
  EXPECT_NEAR(result.matches[0].score, 0.85f, 1e-4);
  EXPECT_EQ(result.matches[1].photo_reference, "solo.jpg");
}

TEST_F(SearchServiceTest, Search_SeveralQueryFacesKeepMaxPerPhoto) {
  // Face 0 of "p.jpg" is close to query A, face 1 is closer to query B
  std::vector<float> face_a = TestUtilities::vector_with_cosine(0.7f, 0, 2);
  std::vector<float> face_b = TestUtilities::vector_with_cosine(0.95f, 1, 3);
  store_->put("alice", "p.jpg", {face_a, face_b});

  SearchQuery query;
  query.embeddings = {TestUtilities::unit_vector(0), TestUtilities::unit_vector(1)};

  auto result = service_->search("alice", query);

  ASSERT_EQ(result.matches.size(), 1u);
  EXPECT_EQ(result.matches[0].photo_reference, "p.jpg");
  EXPECT_NEAR(result.matches[0].score, 0.95f, 1e-4);
}

TEST_F(SearchServiceTest, Search_StricterTierReturnsSubsetOfLooserTier) {
  add_photo("a.jpg", {0.95f});
  add_photo("b.jpg", {0.75f});
  add_photo("c.jpg", {0.65f});
  add_photo("d.jpg", {0.5f});
  add_photo("e.jpg", {0.3f});

  auto strict = references(service_->search("alice", query_for(ThresholdTier::Strict)));
  auto standard = references(service_->search("alice", query_for(ThresholdTier::Standard)));
  auto loose = references(service_->search("alice", query_for(ThresholdTier::Loose)));

  EXPECT_EQ(strict, (std::vector<std::string>{"a.jpg", "b.jpg"}));
  EXPECT_EQ(standard, (std::vector<std::string>{"a.jpg", "b.jpg", "c.jpg"}));
  EXPECT_EQ(loose, (std::vector<std::string>{"a.jpg", "b.jpg", "c.jpg", "d.jpg"}));
}

TEST_F(SearchServiceTest, Search_RawThresholdAndLimit) {
  add_photo("a.jpg", {0.95f});
  add_photo("b.jpg", {0.9f});
  add_photo("c.jpg", {0.8f});

  SearchQuery query = query_for(ThresholdTier::Loose);
  query.raw_threshold = 0.85f;
  auto raw = service_->search("alice", query);
  EXPECT_EQ(references(raw), (std::vector<std::string>{"a.jpg", "b.jpg"}));
  EXPECT_FLOAT_EQ(raw.threshold, 0.85f);

  SearchQuery limited = query_for(ThresholdTier::Loose);
  limited.limit = 1;
  EXPECT_EQ(references(service_->search("alice", limited)), (std::vector<std::string>{"a.jpg"}));
}

TEST_F(SearchServiceTest, Search_InvalidQueriesRejected) {
  SearchQuery empty;
  EXPECT_THROW(service_->search("alice", empty), SearchServiceError);

  SearchQuery mixed;
  mixed.embeddings = {TestUtilities::unit_vector(0, 8), TestUtilities::unit_vector(0, 4)};
  EXPECT_THROW(service_->search("alice", mixed), SearchServiceError);

  SearchQuery out_of_range = query_for(ThresholdTier::Standard);
  out_of_range.raw_threshold = 3.0f;
  EXPECT_THROW(service_->search("alice", out_of_range), SearchServiceError);
}

TEST_F(SearchServiceTest, Search_EmptyCorpusReturnsNoMatches) {
  auto result = service_->search("alice", query_for(ThresholdTier::Loose));

  EXPECT_TRUE(result.matches.empty());
  EXPECT_EQ(result.photos_scanned, 0u);
}

TEST_F(SearchServiceTest, Search_FallsBackToRemoteWhenLocalEmpty) {
  facefind_core::FaceEmbedding face;
  face.owner = "alice";
  face.photo_reference = "remote.jpg";
  face.vector = TestUtilities::vector_with_cosine(0.8f);
  remote_->replace_photo("alice", "remote.jpg", {face});

  auto result = service_->search("alice", query_for(ThresholdTier::Standard));

  EXPECT_TRUE(result.from_remote);
  ASSERT_EQ(result.matches.size(), 1u);
  EXPECT_EQ(result.matches[0].photo_reference, "remote.jpg");
  EXPECT_TRUE(local_repo_->photo_exists("alice", "remote.jpg"));
}

TEST_F(SearchServiceTest, Search_IgnoresStoredFacesOfOtherDimension) {
  add_photo("ok.jpg", {0.9f});
  store_->put("alice", "old_model.jpg", {TestUtilities::unit_vector(0, 4)});

  auto result = service_->search("alice", query_for(ThresholdTier::Standard));

  EXPECT_EQ(references(result), (std::vector<std::string>{"ok.jpg"}));
  EXPECT_EQ(result.faces_scanned, 1u);
}

TEST_F(SearchServiceTest, Search_DoesNotSeeOtherOwners) {
  store_->put("bob", "bob.jpg", {TestUtilities::vector_with_cosine(0.99f)});
  add_photo("mine.jpg", {0.9f});

  auto result = service_->search("alice", query_for(ThresholdTier::Loose));

  EXPECT_EQ(references(result), (std::vector<std::string>{"mine.jpg"}));
}

TEST_F(SearchServiceTest, SearchByImage_UsesEveryDetectedFace) {
  add_photo("a.jpg", {0.9f});
  std::vector<unsigned char> image = {'i', 'm', 'g'};
  EXPECT_CALL(*producer_, detect_and_embed(image))
      .WillOnce(Return(std::vector<std::vector<float>>{TestUtilities::unit_vector(0)}));

  auto result = service_->search_by_image("alice", image);

  EXPECT_EQ(references(result), (std::vector<std::string>{"a.jpg"}));
}

TEST_F(SearchServiceTest, SearchByImage_NoFaceInReferenceIsAnError) {
  EXPECT_CALL(*producer_, detect_and_embed(_))
      .WillOnce(Return(std::vector<std::vector<float>>{}));

  EXPECT_THROW(service_->search_by_image("alice", {'x'}), SearchServiceError);
}

}  // namespace facefind_tests

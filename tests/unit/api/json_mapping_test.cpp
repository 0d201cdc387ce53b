#include <gtest/gtest.h>

#include "facefind_api/json_mapping.hpp"

namespace facefind_tests {

using facefind_api::parse_search_request;
using facefind_core::ThresholdTier;

TEST(JsonMappingTest, ParseSearchRequest_QueriesTierAndLimit) {
  auto query = parse_search_request(
      {{"queries", {{1.0, 0.0}, {0.0, 1.0}}}, {"tier", "strict"}, {"limit", 5}});

  EXPECT_EQ(query.embeddings.size(), 2u);
  EXPECT_EQ(query.tier, ThresholdTier::Strict);
  ASSERT_TRUE(query.limit.has_value());
  EXPECT_EQ(*query.limit, 5u);
  EXPECT_FALSE(query.raw_threshold.has_value());
}

TEST(JsonMappingTest, ParseSearchRequest_SingleEmbeddingAndRawThreshold) {
  auto query = parse_search_request({{"embedding", {0.5, 0.5}}, {"threshold", 0.42}});

  ASSERT_EQ(query.embeddings.size(), 1u);
  EXPECT_EQ(query.tier, ThresholdTier::Standard);
  ASSERT_TRUE(query.raw_threshold.has_value());
  EXPECT_FLOAT_EQ(*query.raw_threshold, 0.42f);
}

TEST(JsonMappingTest, ParseSearchRequest_RejectsBadInput) {
  EXPECT_THROW(parse_search_request(nlohmann::json::array()), std::invalid_argument);
  EXPECT_THROW(parse_search_request({{"tier", "standard"}}), std::invalid_argument);
  EXPECT_THROW(parse_search_request({{"embedding", {1.0}}, {"tier", "fuzzy"}}),
               std::invalid_argument);
  EXPECT_THROW(parse_search_request({{"embedding", {1.0}}, {"limit", 0}}), std::invalid_argument);
  EXPECT_THROW(parse_search_request({{"embedding", "abc"}}), std::invalid_argument);
}

TEST(JsonMappingTest, JobSnapshotToJson) {
  facefind_core::JobSnapshot snapshot;
  snapshot.owner = "alice";
  snapshot.folder = "trip";
  snapshot.state = facefind_core::JobState::Running;
  snapshot.total_items = 4;
  snapshot.processed = 1;
  snapshot.steps[static_cast<size_t>(facefind_core::ProcessingStep::Store)] = {4, 1};
  snapshot.warnings.push_back(
      {"b.jpg", "trip/b.jpg", facefind_core::ProcessingStep::Detect, "No faces detected"});

  auto json = facefind_api::to_json(snapshot);

  EXPECT_EQ(json["state"], "running");
  EXPECT_EQ(json["steps"]["store"]["completed"], 1);
  EXPECT_EQ(json["steps"]["download"]["total"], 0);
  EXPECT_TRUE(json["eta_seconds"].is_null());
  EXPECT_TRUE(json["current_step"].is_null());
  EXPECT_EQ(json["warnings"][0]["step"], "detect");
  EXPECT_FALSE(json.contains("failure_reason"));
}

TEST(JsonMappingTest, SearchResultToJson) {
  facefind_core::SearchResult result;
  result.matches = {{"trip/a.jpg", 0.9f}, {"trip/b.jpg", 0.7f}};
  result.threshold = 0.6f;

  auto json = facefind_api::to_json(result);

  ASSERT_EQ(json["matches"].size(), 2u);
  EXPECT_EQ(json["matches"][0]["photo_reference"], "trip/a.jpg");
  EXPECT_FALSE(json["from_remote"].get<bool>());
}

TEST(JsonMappingTest, StatsToJson) {
  facefind_core::CacheStats cache{3, 4096};
  facefind_core::LocalTierStats store{3, 5, 1};

  auto json = facefind_api::stats_to_json(cache, store);

  EXPECT_EQ(json["cached_files"], 3);
  EXPECT_EQ(json["cached_bytes"], 4096);
  EXPECT_EQ(json["stored_faces"], 5);
  EXPECT_EQ(json["pending_remote_sync"], 1);
}

}  // namespace facefind_tests

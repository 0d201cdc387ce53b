#include <gtest/gtest.h>

#include "facefind_core/recognition/http_embedding_producer.hpp"

namespace facefind_tests {

using facefind_core::EmbeddingProducerError;
using facefind_core::HttpEmbeddingProducer;

TEST(HttpEmbeddingProducerTest, ParseResponse_ListOfEmbeddings) {
  auto vectors = HttpEmbeddingProducer::parse_response(R"({"embeddings": [[1, 0, 0], [0, 1, 0]]})");

  ASSERT_EQ(vectors.size(), 2u);
  EXPECT_EQ(vectors[1], (std::vector<float>{0.0f, 1.0f, 0.0f}));
}

TEST(HttpEmbeddingProducerTest, ParseResponse_FlatVectorIsOneFace) {
  auto vectors = HttpEmbeddingProducer::parse_response(R"({"embeddings": [0.5, 0.5]})");

  ASSERT_EQ(vectors.size(), 1u);
  EXPECT_EQ(vectors[0].size(), 2u);
}

TEST(HttpEmbeddingProducerTest, ParseResponse_FacesWithEmbeddings) {
  auto vectors = HttpEmbeddingProducer::parse_response(
      R"({"faces": [{"bbox": [0, 0, 10, 10], "embedding": [0.1, 0.2]}]})");

  ASSERT_EQ(vectors.size(), 1u);
  EXPECT_FLOAT_EQ(vectors[0][1], 0.2f);
}

TEST(HttpEmbeddingProducerTest, ParseResponse_NoFacesIsEmptyNotError) {
  EXPECT_TRUE(HttpEmbeddingProducer::parse_response(R"({"embeddings": []})").empty());
  EXPECT_TRUE(HttpEmbeddingProducer::parse_response(R"({"faces": []})").empty());
}

TEST(HttpEmbeddingProducerTest, ParseResponse_RejectsMalformedBodies) {
  EXPECT_THROW(HttpEmbeddingProducer::parse_response("<html>"), EmbeddingProducerError);
  EXPECT_THROW(HttpEmbeddingProducer::parse_response(R"({"result": 1})"), EmbeddingProducerError);
  EXPECT_THROW(HttpEmbeddingProducer::parse_response(R"({"embeddings": [[1, 2], [1]]})"),
               EmbeddingProducerError);
  EXPECT_THROW(HttpEmbeddingProducer::parse_response(R"({"embeddings": [["a"]]})"),
               EmbeddingProducerError);
}

}  // namespace facefind_tests

#pragma once

#include <string>

#include "facefind_core/net/http_client.hpp"
#include "facefind_core/recognition/embedding_producer.hpp"

namespace facefind_core {

// Recognition service reached over HTTP: POST {"model", "image": base64}.
class HttpEmbeddingProducer : public EmbeddingProducer {
 public:
  HttpEmbeddingProducer(std::string recognition_url, std::string model, long timeout_seconds = 60);

  HttpEmbeddingProducer(const HttpEmbeddingProducer&) = delete;
  HttpEmbeddingProducer& operator=(const HttpEmbeddingProducer&) = delete;

  std::vector<std::vector<float>> detect_and_embed(
      const std::vector<unsigned char>& image_bytes) override;

  // Accepts {"embeddings": [[...], ...]} or {"faces": [{"embedding": [...]}, ...]}.
  static std::vector<std::vector<float>> parse_response(const std::string& body);

 private:
  std::string recognition_url_;
  std::string model_;
  HttpClient client_;
};

}  // namespace facefind_core

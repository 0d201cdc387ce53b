#include "facefind_core/recognition/http_embedding_producer.hpp"

#include <nlohmann/json.hpp>

#include "facefind_core/util/digest.hpp"

namespace facefind_core {

HttpEmbeddingProducer::HttpEmbeddingProducer(std::string recognition_url,
                                             std::string model,
                                             long timeout_seconds)
    : recognition_url_(std::move(recognition_url)),
      model_(std::move(model)),
      client_(timeout_seconds, {"Content-Type: application/json", "Accept: application/json"}) {}

std::vector<std::vector<float>> HttpEmbeddingProducer::detect_and_embed(
    const std::vector<unsigned char>& image_bytes) {
  if (image_bytes.empty()) {
    throw EmbeddingProducerError("Cannot detect faces in an empty image");
  }

  nlohmann::json request = {{"model", model_}, {"image", base64_encode(image_bytes)}};
  try {
    HttpResponse response = client_.post(recognition_url_, request.dump());
    return parse_response(response.body);
  } catch (const HttpError& e) {
    throw EmbeddingProducerError("Recognition request failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> HttpEmbeddingProducer::parse_response(const std::string& body) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw EmbeddingProducerError(std::string("Recognition response is not valid JSON: ") +
                                 e.what());
  }

  std::vector<std::vector<float>> vectors;
  try {
    if (json.contains("embeddings")) {
      const auto& embeddings = json["embeddings"];
      if (!embeddings.is_array()) {
        throw EmbeddingProducerError("Embeddings field is not an array");
      }
      // A single flat vector is one face
      if (!embeddings.empty() && embeddings[0].is_number()) {
        vectors.push_back(embeddings.get<std::vector<float>>());
      } else {
        vectors = embeddings.get<std::vector<std::vector<float>>>();
      }
    } else if (json.contains("faces")) {
      const auto& faces = json["faces"];
      if (!faces.is_array()) {
        throw EmbeddingProducerError("Faces field is not an array");
      }
      for (const auto& face : faces) {
        if (!face.contains("embedding")) {
          throw EmbeddingProducerError("Face entry without an embedding");
        }
        vectors.push_back(face["embedding"].get<std::vector<float>>());
      }
    } else {
      throw EmbeddingProducerError("Response contains neither embeddings nor faces");
    }
  } catch (const nlohmann::json::type_error& e) {
    throw EmbeddingProducerError(std::string("Malformed embedding values: ") + e.what());
  }

  for (const auto& vector : vectors) {
    if (vector.empty() || vector.size() != vectors.front().size()) {
      throw EmbeddingProducerError("Face vectors in one response must share a non-zero dimension");
    }
  }
  return vectors;
}

}  // namespace facefind_core

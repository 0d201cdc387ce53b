#pragma once

#include <string>
#include <vector>

namespace facefind_core {

class EmbeddingProducerError : public std::exception {
 public:
  explicit EmbeddingProducerError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class EmbeddingProducer
 * @brief Face detection and embedding engine.
 *
 * Image bytes in, zero or more fixed-length face vectors out. An empty
 * result means no face was found and is not an error.
 */
class EmbeddingProducer {
 public:
  virtual ~EmbeddingProducer() = default;

  virtual std::vector<std::vector<float>> detect_and_embed(
      const std::vector<unsigned char>& image_bytes) = 0;
};

}  // namespace facefind_core

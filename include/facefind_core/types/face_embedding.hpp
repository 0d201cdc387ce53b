#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace facefind_core {

struct FaceEmbedding {
  std::string owner;
  std::string photo_reference;
  int face_index = 0;
  std::vector<float> vector;
  std::chrono::system_clock::time_point created_at;

  int dimension() const {
    return static_cast<int>(vector.size());
  }
};

// All faces of one photo. An empty face list is the cached zero-face outcome.
struct PhotoFaces {
  std::string photo_reference;
  std::vector<FaceEmbedding> faces;
};

}  // namespace facefind_core

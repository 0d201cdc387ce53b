#include "utilities_test.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace facefind_tests {

namespace {

std::string unique_suffix() {
  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  return std::to_string(::getpid()) + "_" + std::to_string(timestamp) + "_" +
         std::to_string(counter++);
}

}  // namespace

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = std::filesystem::temp_directory_path() / "facefind_tests";
  std::filesystem::create_directories(temp_dir);
  return temp_dir / ("test_" + unique_suffix() + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  // WAL side files
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);

  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir) && std::filesystem::is_empty(parent_dir)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + unique_suffix());
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::remove_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::vector<float> TestUtilities::unit_vector(int axis, int dimension) {
  std::vector<float> v(dimension, 0.0f);
  v[axis] = 1.0f;
  return v;
}

std::vector<float> TestUtilities::vector_with_cosine(float cosine,
                                                     int axis,
                                                     int toward_axis,
                                                     int dimension) {
  std::vector<float> v(dimension, 0.0f);
  v[axis] = cosine;
  v[toward_axis] = std::sqrt(std::max(0.0f, 1.0f - cosine * cosine));
  return v;
}

float TestUtilities::cosine(const std::vector<float>& a, const std::vector<float>& b) {
  float dot = 0.0f;
  float na = 0.0f;
  float nb = 0.0f;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

facefind_core::SourceFile TestUtilities::create_source_file(const std::string& id,
                                                            uint64_t byte_size,
                                                            const std::string& marker) {
  facefind_core::SourceFile file;
  file.id = id;
  file.display_name = id;
  file.byte_size = byte_size;
  file.modified_marker = marker;
  return file;
}

}  // namespace facefind_tests

#pragma once

#include <cstdint>
#include <string>

namespace facefind_core {

// A photo as observed in a source listing. Re-observed on every run.
struct SourceFile {
  std::string id;
  std::string display_name;
  uint64_t byte_size = 0;
  std::string modified_marker;
};

}  // namespace facefind_core

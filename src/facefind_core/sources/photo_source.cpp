#include "facefind_core/sources/photo_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace facefind_core {

bool ListingFilter::accepts(const SourceFile& file) const {
  const std::string name = std::filesystem::path(file.display_name).filename().string();
  if (name.empty()) {
    return false;
  }
  // macOS resource forks ("._IMG_0001.jpg") and hidden files
  if (skip_system_files && (name.rfind("._", 0) == 0 || name == ".DS_Store")) {
    return false;
  }
  if (image_extensions.empty()) {
    return true;
  }

  std::string extension = std::filesystem::path(name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(image_extensions.begin(), image_extensions.end(), extension) !=
         image_extensions.end();
}

std::vector<SourceFile> filter_listing(const std::vector<SourceFile>& files,
                                       const ListingFilter& filter) {
  std::vector<SourceFile> accepted;
  accepted.reserve(files.size());
  for (const auto& file : files) {
    if (filter.accepts(file)) {
      accepted.push_back(file);
    }
  }
  return accepted;
}

}  // namespace facefind_core

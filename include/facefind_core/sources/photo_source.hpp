#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "facefind_core/types/source_file.hpp"

namespace facefind_core {

class PhotoSourceError : public std::exception {
 public:
  explicit PhotoSourceError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class PhotoSource
 * @brief A bulk photo source such as a shared folder.
 *
 * `folder` is the source scope. File ids are stable within a scope.
 */
class PhotoSource {
 public:
  virtual ~PhotoSource() = default;

  virtual std::vector<SourceFile> list_files(const std::string& folder) = 0;

  // Writes the full file content to `out`. Throws on any failure.
  virtual void download(const std::string& folder, const SourceFile& file, std::ostream& out) = 0;
};

struct ListingFilter {
  bool skip_system_files = true;
  // Lowercase, with leading dot. Empty accepts every extension.
  std::vector<std::string> image_extensions = {".jpg", ".jpeg", ".png", ".webp"};

  bool accepts(const SourceFile& file) const;
};

std::vector<SourceFile> filter_listing(const std::vector<SourceFile>& files,
                                       const ListingFilter& filter);

}  // namespace facefind_core

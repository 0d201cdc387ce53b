#pragma once

#include <filesystem>

#include "facefind_core/sources/photo_source.hpp"

namespace facefind_core {

// Serves folders below a root directory. File ids are paths relative to the folder.
class LocalFolderSource : public PhotoSource {
 public:
  explicit LocalFolderSource(std::filesystem::path root);

  std::vector<SourceFile> list_files(const std::string& folder) override;
  void download(const std::string& folder, const SourceFile& file, std::ostream& out) override;

 private:
  std::filesystem::path resolve(const std::string& folder, const std::string& relative = "") const;

  std::filesystem::path root_;
};

}  // namespace facefind_core

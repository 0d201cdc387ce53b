#include "facefind_core/sources/local_folder_source.hpp"

#include <algorithm>
#include <fstream>

namespace facefind_core {

namespace {

bool escapes_root(const std::filesystem::path& relative) {
  for (const auto& part : relative) {
    if (part == "..") {
      return true;
    }
  }
  return relative.is_absolute();
}

}  // namespace

LocalFolderSource::LocalFolderSource(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path LocalFolderSource::resolve(const std::string& folder,
                                                 const std::string& relative) const {
  std::filesystem::path folder_path(folder);
  std::filesystem::path relative_path(relative);
  if (escapes_root(folder_path) || escapes_root(relative_path)) {
    throw PhotoSourceError("Path escapes the source root: " + folder + "/" + relative);
  }
  return (root_ / folder_path / relative_path).lexically_normal();
}

std::vector<SourceFile> LocalFolderSource::list_files(const std::string& folder) {
  const std::filesystem::path base = resolve(folder);
  std::error_code ec;
  if (!std::filesystem::is_directory(base, ec)) {
    throw PhotoSourceError("Source folder does not exist: " + base.string());
  }

  std::vector<SourceFile> files;
  std::filesystem::recursive_directory_iterator it(base, ec);
  if (ec) {
    throw PhotoSourceError("Failed to list " + base.string() + ": " + ec.message());
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file()) {
      continue;
    }
    SourceFile file;
    file.id = std::filesystem::relative(entry.path(), base).generic_string();
    file.display_name = entry.path().filename().string();
    file.byte_size = static_cast<uint64_t>(entry.file_size());
    file.modified_marker =
        std::to_string(entry.last_write_time().time_since_epoch().count());
    files.push_back(std::move(file));
  }

  std::sort(files.begin(), files.end(),
            [](const SourceFile& a, const SourceFile& b) { return a.id < b.id; });
  return files;
}

void LocalFolderSource::download(const std::string& folder,
                                 const SourceFile& file,
                                 std::ostream& out) {
  const std::filesystem::path path = resolve(folder, file.id);
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw PhotoSourceError("Failed to open source file: " + path.string());
  }
  out << in.rdbuf();
  if (!out.good()) {
    throw PhotoSourceError("Failed to copy source file: " + path.string());
  }
}

}  // namespace facefind_core

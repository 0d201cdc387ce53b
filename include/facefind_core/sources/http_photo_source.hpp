#pragma once

#include <string>

#include "facefind_core/net/http_client.hpp"
#include "facefind_core/sources/photo_source.hpp"

namespace facefind_core {

/**
 * @class HttpPhotoSource
 * @brief Photo source behind a JSON listing API.
 *
 * Listing: GET {base}/folders/{folder}/files returning either an array or
 * {"files": [...]} of {id, name, size, modified}.
 * Content: GET {base}/folders/{folder}/files/{id}/content.
 */
class HttpPhotoSource : public PhotoSource {
 public:
  HttpPhotoSource(std::string base_url, std::string access_token, long timeout_seconds = 60);

  std::vector<SourceFile> list_files(const std::string& folder) override;
  void download(const std::string& folder, const SourceFile& file, std::ostream& out) override;

  static std::vector<SourceFile> parse_listing(const std::string& body);

 private:
  std::string base_url_;
  HttpClient client_;
};

}  // namespace facefind_core

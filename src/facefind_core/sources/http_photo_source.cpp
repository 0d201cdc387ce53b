#include "facefind_core/sources/http_photo_source.hpp"

#include <nlohmann/json.hpp>

namespace facefind_core {

namespace {

std::vector<std::string> auth_headers(const std::string& token) {
  std::vector<std::string> headers = {"Accept: application/json"};
  if (!token.empty()) {
    headers.push_back("Authorization: Bearer " + token);
  }
  return headers;
}

std::string marker_from_json(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return "";
  }
  return value.dump();
}

}  // namespace

HttpPhotoSource::HttpPhotoSource(std::string base_url, std::string access_token, long timeout_seconds)
    : base_url_(std::move(base_url)), client_(timeout_seconds, auth_headers(access_token)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::vector<SourceFile> HttpPhotoSource::list_files(const std::string& folder) {
  try {
    HttpResponse response =
        client_.get(base_url_ + "/folders/" + HttpClient::escape(folder) + "/files");
    return parse_listing(response.body);
  } catch (const HttpError& e) {
    throw PhotoSourceError("Listing folder '" + folder + "' failed: " + e.what());
  }
}

void HttpPhotoSource::download(const std::string& folder, const SourceFile& file, std::ostream& out) {
  try {
    client_.download(base_url_ + "/folders/" + HttpClient::escape(folder) + "/files/" +
                         HttpClient::escape(file.id) + "/content",
                     out);
  } catch (const HttpError& e) {
    throw PhotoSourceError("Downloading '" + file.id + "' failed: " + e.what());
  }
}

std::vector<SourceFile> HttpPhotoSource::parse_listing(const std::string& body) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw PhotoSourceError(std::string("Listing is not valid JSON: ") + e.what());
  }

  const nlohmann::json* items = &json;
  if (json.is_object() && json.contains("files")) {
    items = &json["files"];
  }
  if (!items->is_array()) {
    throw PhotoSourceError("Listing must be an array of files");
  }

  std::vector<SourceFile> files;
  files.reserve(items->size());
  for (const auto& item : *items) {
    if (!item.is_object() || !item.contains("id")) {
      throw PhotoSourceError("Listing entry without an id: " + item.dump());
    }
    SourceFile file;
    file.id = item["id"].is_string() ? item["id"].get<std::string>() : item["id"].dump();
    file.display_name = item.value("name", file.id);
    if (item.contains("size") && item["size"].is_number()) {
      file.byte_size = item["size"].get<uint64_t>();
    } else if (item.contains("size") && item["size"].is_string()) {
      try {
        file.byte_size = std::stoull(item["size"].get<std::string>());
      } catch (const std::exception&) {
        throw PhotoSourceError("Listing entry has a malformed size: " + item.dump());
      }
    }
    if (item.contains("modified")) {
      file.modified_marker = marker_from_json(item["modified"]);
    }
    files.push_back(std::move(file));
  }
  return files;
}

}  // namespace facefind_core

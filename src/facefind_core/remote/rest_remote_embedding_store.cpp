#include "facefind_core/remote/rest_remote_embedding_store.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

#include "facefind_core/util/time_format.hpp"

namespace facefind_core {

namespace {

std::vector<std::string> rest_headers(const std::string& api_key) {
  return {"apikey: " + api_key, "Authorization: Bearer " + api_key,
          "Content-Type: application/json", "Accept: application/json"};
}

std::string eq(const std::string& value) {
  return "eq." + HttpClient::escape(value);
}

}  // namespace

RestRemoteEmbeddingStore::RestRemoteEmbeddingStore(std::string base_url,
                                                   const std::string& api_key,
                                                   long timeout_seconds,
                                                   size_t page_size)
    : base_url_(std::move(base_url)),
      page_size_(page_size),
      client_(timeout_seconds, rest_headers(api_key)) {
  if (page_size_ == 0) {
    throw std::invalid_argument("RestRemoteEmbeddingStore page size must be positive");
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string RestRemoteEmbeddingStore::table_url() const {
  return base_url_ + "/faces";
}

nlohmann::json RestRemoteEmbeddingStore::to_rows(const std::string& owner,
                                                 const std::string& photo_reference,
                                                 const std::vector<FaceEmbedding>& faces) {
  const std::string now = time_point_to_string(std::chrono::system_clock::now());
  nlohmann::json rows = nlohmann::json::array();
  if (faces.empty()) {
    rows.push_back({{"owner", owner},
                    {"photo_reference", photo_reference},
                    {"face_index", kNoFaceMarkerIndex},
                    {"dimension", 0},
                    {"embedding", nlohmann::json::array()},
                    {"created_at", now},
                    {"updated_at", now}});
    return rows;
  }
  for (const auto& face : faces) {
    rows.push_back({{"owner", owner},
                    {"photo_reference", photo_reference},
                    {"face_index", face.face_index},
                    {"dimension", face.dimension()},
                    {"embedding", face.vector},
                    {"created_at", time_point_to_string(face.created_at)},
                    {"updated_at", now}});
  }
  return rows;
}

std::vector<PhotoFaces> RestRemoteEmbeddingStore::from_rows(const nlohmann::json& rows) {
  if (!rows.is_array()) {
    throw RemoteStoreError("Remote response is not an array of rows");
  }

  std::map<std::string, PhotoFaces> by_photo;
  try {
    for (const auto& row : rows) {
      const std::string owner = row.at("owner").get<std::string>();
      const std::string reference = row.at("photo_reference").get<std::string>();
      PhotoFaces& photo = by_photo[reference];
      photo.photo_reference = reference;

      const int face_index = row.at("face_index").get<int>();
      if (face_index == kNoFaceMarkerIndex) {
        continue;
      }
      FaceEmbedding face;
      face.owner = owner;
      face.photo_reference = reference;
      face.face_index = face_index;
      face.vector = row.at("embedding").get<std::vector<float>>();
      if (row.contains("dimension") && row["dimension"].get<int>() != face.dimension()) {
        throw RemoteStoreError("Remote face " + reference + "#" + std::to_string(face_index) +
                               " does not match its recorded dimension");
      }
      if (row.contains("created_at") && row["created_at"].is_string()) {
        const std::string created_at = row["created_at"].get<std::string>();
        try {
          face.created_at = string_to_time_point(created_at);
        } catch (const std::runtime_error& e) {
          // The vector is still usable; keep the read and leave the timestamp unset
          std::cerr << "RestRemoteEmbeddingStore: ignoring created_at of " << reference << ": "
                    << e.what() << std::endl;
        }
      }
      photo.faces.push_back(std::move(face));
    }
  } catch (const nlohmann::json::exception& e) {
    throw RemoteStoreError(std::string("Malformed remote face row: ") + e.what());
  }

  std::vector<PhotoFaces> photos;
  photos.reserve(by_photo.size());
  for (auto& entry : by_photo) {
    std::sort(entry.second.faces.begin(), entry.second.faces.end(),
              [](const FaceEmbedding& a, const FaceEmbedding& b) {
                return a.face_index < b.face_index;
              });
    photos.push_back(std::move(entry.second));
  }
  return photos;
}

void RestRemoteEmbeddingStore::replace_photo(const std::string& owner,
                                             const std::string& photo_reference,
                                             const std::vector<FaceEmbedding>& faces) {
  try {
    client_.del(table_url() + "?owner=" + eq(owner) + "&photo_reference=" + eq(photo_reference));
    client_.post(table_url(), to_rows(owner, photo_reference, faces).dump(),
                 {"Prefer: return=minimal"});
  } catch (const HttpError& e) {
    throw RemoteStoreError("Remote replace of " + photo_reference + " failed: " + e.what());
  }
}

std::optional<std::vector<FaceEmbedding>> RestRemoteEmbeddingStore::get_photo(
    const std::string& owner, const std::string& photo_reference) {
  nlohmann::json rows;
  try {
    HttpResponse response =
        client_.get(table_url() + "?owner=" + eq(owner) + "&photo_reference=" +
                    eq(photo_reference) + "&order=face_index.asc");
    rows = nlohmann::json::parse(response.body);
  } catch (const HttpError& e) {
    throw RemoteStoreError("Remote read of " + photo_reference + " failed: " + e.what());
  } catch (const nlohmann::json::parse_error& e) {
    throw RemoteStoreError("Remote read of " + photo_reference +
                           " returned invalid JSON: " + e.what());
  }

  std::vector<PhotoFaces> photos = from_rows(rows);
  if (photos.empty()) {
    return std::nullopt;
  }
  return std::move(photos.front().faces);
}

nlohmann::json RestRemoteEmbeddingStore::collect_pages(const PageFetcher& fetch_page,
                                                     size_t page_size) {
  nlohmann::json rows = nlohmann::json::array();
  size_t offset = 0;
  while (true) {
    nlohmann::json page = fetch_page(offset, page_size);
    if (!page.is_array()) {
      throw RemoteStoreError("Remote response is not an array of rows");
    }
    if (page.empty()) {
      break;
    }
    offset += page.size();
    for (auto& row : page) {
      rows.push_back(std::move(row));
    }
  }
  return rows;
}

std::vector<PhotoFaces> RestRemoteEmbeddingStore::get_all(const std::string& owner) {
  // A stable order keeps offsets meaningful across pages
  const std::string query = table_url() + "?owner=" + eq(owner) +
                            "&order=photo_reference.asc,face_index.asc";
  nlohmann::json rows = collect_pages(
      [this, &owner, &query](size_t offset, size_t limit) {
        try {
          HttpResponse response = client_.get(query + "&limit=" + std::to_string(limit) +
                                              "&offset=" + std::to_string(offset));
          return nlohmann::json::parse(response.body);
        } catch (const HttpError& e) {
          throw RemoteStoreError("Remote read for owner " + owner + " failed: " + e.what());
        } catch (const nlohmann::json::parse_error& e) {
          throw RemoteStoreError("Remote read for owner " + owner + " returned invalid JSON: " +
                                 e.what());
        }
      },
      page_size_);
  return from_rows(rows);
}

}  // namespace facefind_core

#include "facefind_core/net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace facefind_core {

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
  std::call_once(curl_init_flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw HttpError("Failed to initialize libcurl");
    }
  });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

}  // namespace

HttpClient::HttpClient(long timeout_seconds, std::vector<std::string> default_headers)
    : timeout_seconds_(timeout_seconds), default_headers_(std::move(default_headers)) {
  ensure_curl_initialized();
}

size_t HttpClient::write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

size_t HttpClient::write_to_stream(void* contents, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::ostream*>(userp);
  out->write(static_cast<char*>(contents), static_cast<std::streamsize>(size * nmemb));
  // Returning less than requested makes curl abort with CURLE_WRITE_ERROR
  return out->good() ? size * nmemb : 0;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) const {
  return perform("GET", url, nullptr, nullptr, headers);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers) const {
  return perform("POST", url, &body, nullptr, headers);
}

HttpResponse HttpClient::del(const std::string& url, const std::vector<std::string>& headers) const {
  return perform("DELETE", url, nullptr, nullptr, headers);
}

void HttpClient::download(const std::string& url,
                          std::ostream& out,
                          const std::vector<std::string>& headers) const {
  perform("GET", url, nullptr, &out, headers);
}

HttpResponse HttpClient::perform(const std::string& method,
                                 const std::string& url,
                                 const std::string* body,
                                 std::ostream* sink,
                                 const std::vector<std::string>& headers) const {
  CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw HttpError("Failed to initialize CURL");
  }

  HeaderList header_list(nullptr, curl_slist_free_all);
  auto append_header = [&](const std::string& header) {
    curl_slist* next = curl_slist_append(header_list.get(), header.c_str());
    if (!next) {
      throw HttpError("Failed to build request headers");
    }
    header_list.release();
    header_list.reset(next);
  };
  for (const auto& header : default_headers_) {
    append_header(header);
  }
  for (const auto& header : headers) {
    append_header(header);
  }

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body ? body->c_str() : "");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body ? body->size() : 0));
  } else if (method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  if (sink) {
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, sink);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  }

  CURLcode res = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  if (res != CURLE_OK) {
    throw HttpError(method + " " + url + " failed: " + std::string(curl_easy_strerror(res)),
                    response.status_code);
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    throw HttpError(method + " " + url + " returned HTTP " +
                        std::to_string(response.status_code) +
                        (response.body.empty() ? "" : ": " + response.body),
                    response.status_code);
  }
  return response;
}

std::string HttpClient::escape(const std::string& value) {
  ensure_curl_initialized();
  char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw HttpError("Failed to URL-escape value");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

}  // namespace facefind_core

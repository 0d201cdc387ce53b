#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace facefind_core {

class HttpError : public std::exception {
 public:
  explicit HttpError(const std::string& message, long status_code = 0)
      : message_(message), status_code_(status_code) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  // 0 when the request never produced an HTTP status
  long status_code() const {
    return status_code_;
  }

 private:
  std::string message_;
  long status_code_;
};

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

/**
 * @class HttpClient
 * @brief Thin libcurl wrapper shared by every remote collaborator.
 *
 * Each request uses its own easy handle, so one client may be shared by
 * several worker threads. Non-2xx responses raise HttpError.
 */
class HttpClient {
 public:
  explicit HttpClient(long timeout_seconds = 30, std::vector<std::string> default_headers = {});

  HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {}) const;
  HttpResponse post(const std::string& url,
                    const std::string& body,
                    const std::vector<std::string>& headers = {}) const;
  HttpResponse del(const std::string& url, const std::vector<std::string>& headers = {}) const;

  // Streams the response body into `out` without buffering it in memory.
  void download(const std::string& url,
                std::ostream& out,
                const std::vector<std::string>& headers = {}) const;

  static std::string escape(const std::string& value);

 private:
  HttpResponse perform(const std::string& method,
                       const std::string& url,
                       const std::string* body,
                       std::ostream* sink,
                       const std::vector<std::string>& headers) const;

  static size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp);
  static size_t write_to_stream(void* contents, size_t size, size_t nmemb, void* userp);

  long timeout_seconds_;
  std::vector<std::string> default_headers_;
};

}  // namespace facefind_core

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <string>

struct HttpResponse {
  int status_code = 0;
  std::string body;
  std::string error;     // transport-level error, empty on success
  double elapsed_ms = 0.0;

  bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

/**
 * Minimal blocking HTTP GET. Virtual so feed adapters can be exercised
 * against canned responses.
 */
class HttpClient {
public:
  explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::milliseconds(8000),
                      const std::string& user_agent = "airgeo/1.0");
  virtual ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  virtual HttpResponse get(const std::string& url);

  // Percent-encodes everything outside the RFC 3986 unreserved set
  static std::string urlEncode(const std::string& value);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
  std::string user_agent_;
};

#endif // HTTP_CLIENT_HPP

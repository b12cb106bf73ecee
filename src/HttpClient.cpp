#include "HttpClient.hpp"
#include <curl/curl.h>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::once_flag curl_init_flag;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  std::string* body = static_cast<std::string*>(userp);
  body->append(static_cast<char*>(contents), total);
  return total;
}

} // namespace

HttpClient::HttpClient(std::chrono::milliseconds timeout, const std::string& user_agent)
    : timeout_(timeout), user_agent_(user_agent) {
  std::call_once(curl_init_flag, [] {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      std::cerr << "HttpClient: curl_global_init failed: "
                << curl_easy_strerror(rc) << std::endl;
    }
  });
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::get(const std::string& url) {
  HttpResponse response;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "Failed to initialize CURL";
    return response;
  }

  auto start = std::chrono::steady_clock::now();

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  // Worker threads must not receive SIGALRM from the resolver
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);

  auto end = std::chrono::steady_clock::now();
  response.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

  if (res == CURLE_OK) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
  } else {
    response.error = curl_easy_strerror(res);
  }

  curl_easy_cleanup(curl);
  return response;
}

std::string HttpClient::urlEncode(const std::string& value) {
  std::ostringstream encoded;
  encoded << std::hex << std::uppercase;

  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return encoded.str();
}

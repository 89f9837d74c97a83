#ifndef ECR_IO_HTTP_CLIENT_HPP
#define ECR_IO_HTTP_CLIENT_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace ecr_io
{

/**
 * @brief Raised when a request gets no HTTP response at all
 *
 * Covers DNS and connection failures, TLS errors and timeouts.
 */
class TransportError final : public std::runtime_error
{
public:
  explicit TransportError(const std::string& msg)
    : std::runtime_error(msg)
  {
  }
};

/**
 * @brief Process-wide libcurl initialisation
 *
 * Create exactly one in main() before any other thread starts; libcurl's
 * global state is torn down when it goes out of scope.
 */
class CurlGlobal
{
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlEasyDeleter
{
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter
{
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct HttpResponse
{
  long status{0};
  std::string body;
};

/**
 * @brief Minimal blocking HTTP client on top of the libcurl easy interface
 *
 * Every call uses a fresh easy handle, so one client may be shared between
 * threads.
 */
class HttpClient
{
public:
  struct Options
  {
    std::chrono::seconds timeout{30};
    bool verifyTls{true};
    std::string username;  // Basic authentication, unused when empty
    std::string password;
  };

  explicit HttpClient(Options options);

  /**
   * @throws TransportError if no response was received
   */
  HttpResponse get(const std::string& url) const;

  /**
   * @throws TransportError if no response was received
   */
  HttpResponse post(const std::string& url,
                    const std::string& body,
                    const std::string& contentType) const;

  /**
   * @brief Percent-encode a query-string component
   */
  static std::string escape(const std::string& value);

  [[nodiscard]] const Options& getOptions() const { return options_; }

private:
  CurlHandle makeHandle(const std::string& url) const;

  HttpResponse perform(CURL* handle, const std::string& url) const;

  Options options_;
};

}  // namespace ecr_io

#endif  // ECR_IO_HTTP_CLIENT_HPP

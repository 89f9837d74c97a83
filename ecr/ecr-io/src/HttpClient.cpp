#include "ecr-io/src/HttpClient.hpp"

#include <utility>

namespace ecr_io
{

namespace
{

size_t appendToString(char* data, size_t size, size_t count, void* userData)
{
  auto* buffer = static_cast<std::string*>(userData);
  buffer->append(data, size * count);
  return size * count;
}

template <typename T>
void setOption(CURL* handle, CURLoption option, T value)
{
  const CURLcode rc = curl_easy_setopt(handle, option, value);
  if (rc != CURLE_OK)
  {
    throw TransportError(std::string{"curl_easy_setopt failed: "} +
                         curl_easy_strerror(rc));
  }
}

}  // namespace

CurlGlobal::CurlGlobal()
{
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK)
  {
    throw TransportError(std::string{"curl_global_init failed: "} +
                         curl_easy_strerror(rc));
  }
}

CurlGlobal::~CurlGlobal()
{
  curl_global_cleanup();
}

HttpClient::HttpClient(Options options)
  : options_{std::move(options)}
{
}

CurlHandle HttpClient::makeHandle(const std::string& url) const
{
  CurlHandle handle{curl_easy_init()};
  if (!handle)
  {
    throw TransportError("curl_easy_init failed");
  }

  CURL* raw = handle.get();
  setOption(raw, CURLOPT_URL, url.c_str());
  // Worker threads must not receive SIGALRM from the resolver
  setOption(raw, CURLOPT_NOSIGNAL, 1L);
  setOption(raw, CURLOPT_TIMEOUT_MS,
            static_cast<long>(options_.timeout.count() * 1000));
  setOption(raw, CURLOPT_FOLLOWLOCATION, 1L);
  setOption(raw, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
  setOption(raw, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);

  if (!options_.username.empty())
  {
    setOption(raw, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
    setOption(raw, CURLOPT_USERNAME, options_.username.c_str());
    setOption(raw, CURLOPT_PASSWORD, options_.password.c_str());
  }
  return handle;
}

HttpResponse HttpClient::perform(CURL* handle, const std::string& url) const
{
  HttpResponse response;
  setOption(handle, CURLOPT_WRITEFUNCTION, &appendToString);
  setOption(handle, CURLOPT_WRITEDATA, static_cast<void*>(&response.body));

  const CURLcode rc = curl_easy_perform(handle);
  if (rc != CURLE_OK)
  {
    throw TransportError(url + ": " + curl_easy_strerror(rc));
  }

  if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status) !=
      CURLE_OK)
  {
    throw TransportError(url + ": no HTTP status available");
  }
  return response;
}

HttpResponse HttpClient::get(const std::string& url) const
{
  auto handle = makeHandle(url);
  setOption(handle.get(), CURLOPT_HTTPGET, 1L);
  return perform(handle.get(), url);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::string& contentType) const
{
  auto handle = makeHandle(url);

  CurlHeaders headers{
    curl_slist_append(nullptr, ("Content-Type: " + contentType).c_str())};
  if (!headers)
  {
    throw TransportError("Could not allocate request headers");
  }

  setOption(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  setOption(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
  setOption(
    handle.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  return perform(handle.get(), url);
}

std::string HttpClient::escape(const std::string& value)
{
  CurlHandle handle{curl_easy_init()};
  if (!handle)
  {
    throw TransportError("curl_easy_init failed");
  }

  char* encoded =
    curl_easy_escape(handle.get(), value.c_str(), static_cast<int>(value.size()));
  if (encoded == nullptr)
  {
    throw TransportError("Could not URL-encode '" + value + "'");
  }
  std::string result{encoded};
  curl_free(encoded);
  return result;
}

}  // namespace ecr_io

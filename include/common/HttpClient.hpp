#pragma once

#include <chrono>
#include <map>
#include <string>

namespace sbu::common {

/// Outgoing HTTP request.
/// Class abbreviation: hreq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sUrl;
  std::map<std::string, std::string> mapHeaders;
  std::string sBody;
  std::chrono::seconds durTimeout{60};
};

/// Completed HTTP exchange. Header names are lower-cased; for repeated
/// headers the last value wins.
/// Class abbreviation: hres
struct HttpResponse {
  long iStatus = 0;
  std::string sBody;
  std::map<std::string, std::string> mapHeaders;

  bool isSuccess() const { return iStatus >= 200 && iStatus < 300; }
  std::string header(const std::string& sLowerName) const;
};

/// Blocking libcurl wrapper. One easy handle per request.
/// Non-2xx statuses are returned, not thrown; transport failures
/// (DNS, TLS, timeout) throw std::runtime_error.
/// Class abbreviation: hc
class HttpClient {
 public:
  HttpClient();
  virtual ~HttpClient();

  virtual HttpResponse perform(const HttpRequest& hreq);

  /// Call once per process before any request (curl_global_init).
  static void globalInit();
  static void globalCleanup();
};

}  // namespace sbu::common

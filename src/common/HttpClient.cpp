#include "common/HttpClient.hpp"

#include "common/Logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace sbu::common {

namespace {

struct CurlDeleter {
  void operator()(CURL* pCurl) const {
    if (pCurl) {
      curl_easy_cleanup(pCurl);
    }
  }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};
using CurlSlist = std::unique_ptr<curl_slist, SlistDeleter>;

size_t writeBody(char* pData, size_t nSize, size_t nMemb, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  const size_t nBytes = nSize * nMemb;
  pBody->append(pData, nBytes);
  return nBytes;
}

size_t writeHeader(char* pData, size_t nSize, size_t nItems, void* pUser) {
  auto* pHeaders = static_cast<std::map<std::string, std::string>*>(pUser);
  const size_t nBytes = nSize * nItems;
  std::string sLine(pData, nBytes);

  // A new status line (redirects, 100-continue) starts a fresh header block
  if (sLine.rfind("HTTP/", 0) == 0) {
    pHeaders->clear();
    return nBytes;
  }

  const auto nColon = sLine.find(':');
  if (nColon == std::string::npos) {
    return nBytes;
  }

  std::string sName = sLine.substr(0, nColon);
  std::transform(sName.begin(), sName.end(), sName.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string sValue = sLine.substr(nColon + 1);
  const auto nFirst = sValue.find_first_not_of(" \t");
  const auto nLast = sValue.find_last_not_of(" \t\r\n");
  sValue = (nFirst == std::string::npos) ? std::string{}
                                         : sValue.substr(nFirst, nLast - nFirst + 1);

  (*pHeaders)[sName] = sValue;
  return nBytes;
}

}  // anonymous namespace

std::string HttpResponse::header(const std::string& sLowerName) const {
  auto it = mapHeaders.find(sLowerName);
  return it == mapHeaders.end() ? std::string{} : it->second;
}

HttpClient::HttpClient() = default;
HttpClient::~HttpClient() = default;

void HttpClient::globalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }

void HttpClient::globalCleanup() { curl_global_cleanup(); }

HttpResponse HttpClient::perform(const HttpRequest& hreq) {
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }

  CurlSlist slHeaders;
  for (const auto& [sName, sValue] : hreq.mapHeaders) {
    const std::string sLine = sName + ": " + sValue;
    curl_slist* pAppended = curl_slist_append(slHeaders.get(), sLine.c_str());
    if (!pAppended) {
      throw std::runtime_error("curl_slist_append failed");
    }
    slHeaders.release();
    slHeaders.reset(pAppended);
  }

  HttpResponse hres;

  curl_easy_setopt(curl.get(), CURLOPT_URL, hreq.sUrl.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, slHeaders.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &hres.sBody);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, writeHeader);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hres.mapHeaders);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(hreq.durTimeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

  if (hreq.sMethod == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, hreq.sMethod.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, hreq.sBody.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(hreq.sBody.size()));
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(hreq.sMethod + " " + hreq.sUrl + " failed: " +
                             curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &hres.iStatus);
  Logger::get()->debug("{} {} -> {}", hreq.sMethod, hreq.sUrl, hres.iStatus);
  return hres;
}

}  // namespace sbu::common

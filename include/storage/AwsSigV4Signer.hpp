#pragma once

#include <chrono>
#include <map>
#include <string>

namespace sbu::storage {

/// AWS Signature Version 4 request signer (OpenSSL HMAC-SHA256).
/// Class abbreviation: sig
class AwsSigV4Signer {
 public:
  AwsSigV4Signer(std::string sAccessKeyId, std::string sSecretAccessKey, std::string sRegion,
                 std::string sService = "s3");
  ~AwsSigV4Signer();

  AwsSigV4Signer(const AwsSigV4Signer&) = delete;
  AwsSigV4Signer& operator=(const AwsSigV4Signer&) = delete;

  /// Authorization header value for a request.
  /// mapHeaders must use lower-case names and include "host" and "x-amz-date";
  /// every entry is signed. sCanonicalQuery must already be sorted and encoded.
  std::string authorization(const std::string& sMethod, const std::string& sCanonicalUri,
                            const std::string& sCanonicalQuery,
                            const std::map<std::string, std::string>& mapHeaders,
                            const std::string& sPayloadHash) const;

  /// "YYYYMMDDTHHMMSSZ" for tp.
  static std::string amzDate(std::chrono::system_clock::time_point tp);

  static std::string sha256Hex(const std::string& sData);

  /// Base64 of the MD5 digest, as expected by the Content-MD5 header.
  static std::string md5Base64(const std::string& sData);

  /// RFC 3986 encoding; '/' is kept when bKeepSlash is set (object keys).
  static std::string uriEncode(const std::string& sValue, bool bKeepSlash);

 private:
  std::string _sAccessKeyId;
  std::string _sSecretAccessKey;
  std::string _sRegion;
  std::string _sService;
};

}  // namespace sbu::storage

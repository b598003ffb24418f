#include "storage/AwsSigV4Signer.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sbu::storage {

namespace {

std::string toHex(const unsigned char* pData, size_t nLen) {
  std::ostringstream oss;
  for (size_t i = 0; i < nLen; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(pData[i]);
  }
  return oss.str();
}

std::string hmacSha256(const std::string& sKey, const std::string& sData) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  unsigned char* pResult = HMAC(
      EVP_sha256(),
      sKey.data(), static_cast<int>(sKey.size()),
      reinterpret_cast<const unsigned char*>(sData.data()),
      sData.size(),
      vHash, &uHashLen);

  if (!pResult) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  return std::string(reinterpret_cast<char*>(vHash), uHashLen);
}

std::string trimHeaderValue(const std::string& sValue) {
  const auto nFirst = sValue.find_first_not_of(" \t");
  if (nFirst == std::string::npos) return "";
  const auto nLast = sValue.find_last_not_of(" \t");
  std::string sTrimmed;
  bool bSpace = false;
  for (size_t i = nFirst; i <= nLast; ++i) {
    const char c = sValue[i];
    if (c == ' ' || c == '\t') {
      bSpace = true;
      continue;
    }
    if (bSpace) sTrimmed += ' ';
    bSpace = false;
    sTrimmed += c;
  }
  return sTrimmed;
}

}  // anonymous namespace

AwsSigV4Signer::AwsSigV4Signer(std::string sAccessKeyId, std::string sSecretAccessKey,
                               std::string sRegion, std::string sService)
    : _sAccessKeyId(std::move(sAccessKeyId)),
      _sSecretAccessKey(std::move(sSecretAccessKey)),
      _sRegion(std::move(sRegion)),
      _sService(std::move(sService)) {
  if (_sAccessKeyId.empty() || _sSecretAccessKey.empty()) {
    throw std::runtime_error("AWS credentials cannot be empty");
  }
}

AwsSigV4Signer::~AwsSigV4Signer() {
  if (!_sSecretAccessKey.empty()) {
    OPENSSL_cleanse(_sSecretAccessKey.data(), _sSecretAccessKey.size());
  }
}

std::string AwsSigV4Signer::authorization(const std::string& sMethod,
                                          const std::string& sCanonicalUri,
                                          const std::string& sCanonicalQuery,
                                          const std::map<std::string, std::string>& mapHeaders,
                                          const std::string& sPayloadHash) const {
  auto itDate = mapHeaders.find("x-amz-date");
  if (itDate == mapHeaders.end() || itDate->second.size() < 8) {
    throw std::invalid_argument("SigV4: x-amz-date header is required");
  }
  const std::string sAmzDate = itDate->second;
  const std::string sDate = sAmzDate.substr(0, 8);

  // ── Canonical request ──────────────────────────────────────────────────
  std::string sCanonicalHeaders;
  std::string sSignedHeaders;
  for (const auto& [sName, sValue] : mapHeaders) {  // std::map: already sorted
    sCanonicalHeaders += sName + ":" + trimHeaderValue(sValue) + "\n";
    if (!sSignedHeaders.empty()) sSignedHeaders += ';';
    sSignedHeaders += sName;
  }

  const std::string sCanonicalRequest = sMethod + "\n" + sCanonicalUri + "\n" +
                                        sCanonicalQuery + "\n" + sCanonicalHeaders + "\n" +
                                        sSignedHeaders + "\n" + sPayloadHash;

  // ── String to sign ─────────────────────────────────────────────────────
  const std::string sScope = sDate + "/" + _sRegion + "/" + _sService + "/aws4_request";
  const std::string sStringToSign = "AWS4-HMAC-SHA256\n" + sAmzDate + "\n" + sScope + "\n" +
                                    sha256Hex(sCanonicalRequest);

  // ── Signing key ────────────────────────────────────────────────────────
  const std::string sDateKey = hmacSha256("AWS4" + _sSecretAccessKey, sDate);
  const std::string sRegionKey = hmacSha256(sDateKey, _sRegion);
  const std::string sServiceKey = hmacSha256(sRegionKey, _sService);
  const std::string sSigningKey = hmacSha256(sServiceKey, "aws4_request");

  const std::string sRawSig = hmacSha256(sSigningKey, sStringToSign);
  const std::string sSignature =
      toHex(reinterpret_cast<const unsigned char*>(sRawSig.data()), sRawSig.size());

  return "AWS4-HMAC-SHA256 Credential=" + _sAccessKeyId + "/" + sScope +
         ",SignedHeaders=" + sSignedHeaders + ",Signature=" + sSignature;
}

std::string AwsSigV4Signer::amzDate(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmUtc{};
  gmtime_r(&t, &tmUtc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tmUtc);
  return buf;
}

std::string AwsSigV4Signer::sha256Hex(const std::string& sData) {
  unsigned char vDigest[EVP_MAX_MD_SIZE];
  unsigned int uLen = 0;
  if (EVP_Digest(sData.data(), sData.size(), vDigest, &uLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 computation failed");
  }
  return toHex(vDigest, uLen);
}

std::string AwsSigV4Signer::md5Base64(const std::string& sData) {
  unsigned char vDigest[EVP_MAX_MD_SIZE];
  unsigned int uLen = 0;
  if (EVP_Digest(sData.data(), sData.size(), vDigest, &uLen, EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("MD5 computation failed");
  }

  std::vector<unsigned char> vOut(4 * ((uLen + 2) / 3) + 1);
  const int iOutLen = EVP_EncodeBlock(vOut.data(), vDigest, static_cast<int>(uLen));
  return std::string(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iOutLen));
}

std::string AwsSigV4Signer::uriEncode(const std::string& sValue, bool bKeepSlash) {
  std::ostringstream oss;
  for (const unsigned char c : sValue) {
    const bool bUnreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                             (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                             c == '~';
    if (bUnreserved || (bKeepSlash && c == '/')) {
      oss << c;
    } else {
      oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
          << static_cast<int>(c) << std::nouppercase << std::dec;
    }
  }
  return oss.str();
}

}  // namespace sbu::storage

#include "storage/S3ArtifactStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>
#include <tinyxml2.h>

#include <cstring>
#include <fstream>
#include <sstream>

namespace sbu::storage {

namespace {

std::string readFile(const std::filesystem::path& pathFile) {
  std::ifstream ifs(pathFile, std::ios::binary);
  if (!ifs.is_open()) {
    throw common::StorageError("upload_failed", "Cannot open " + pathFile.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) {
    throw common::StorageError("upload_failed", "Cannot read " + pathFile.string());
  }
  return oss.str();
}

/// Element name without its namespace prefix ("s3:Error" -> "Error").
const char* localName(const tinyxml2::XMLElement* pElement) {
  const char* pName = pElement->Name();
  const char* pColon = std::strchr(pName, ':');
  return pColon ? pColon + 1 : pName;
}

const tinyxml2::XMLElement* firstChild(const tinyxml2::XMLElement* pParent,
                                       const char* pLocalName) {
  for (const auto* pChild = pParent->FirstChildElement(); pChild;
       pChild = pChild->NextSiblingElement()) {
    if (std::strcmp(localName(pChild), pLocalName) == 0) return pChild;
  }
  return nullptr;
}

std::string childText(const tinyxml2::XMLElement* pParent, const char* pLocalName) {
  const auto* pChild = firstChild(pParent, pLocalName);
  if (!pChild || !pChild->GetText()) return "";
  return pChild->GetText();
}

/// <Message> of an S3 <Error> document, or empty when the body is not one.
std::string errorMessage(const std::string& sBody) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(sBody.c_str(), sBody.size()) != tinyxml2::XML_SUCCESS) return "";
  const auto* pRoot = doc.RootElement();
  if (!pRoot || std::strcmp(localName(pRoot), "Error") != 0) return "";
  return childText(pRoot, "Message");
}

}  // anonymous namespace

S3ArtifactStore::S3ArtifactStore(common::HttpClient& hcClient, S3Settings s3sSettings,
                                 Clock fnNow)
    : _hcClient(hcClient),
      _s3sSettings(std::move(s3sSettings)),
      _sigSigner(_s3sSettings.sAccessKeyId, _s3sSettings.sSecretAccessKey,
                 _s3sSettings.sRegion),
      _fnNow(std::move(fnNow)) {
  if (_s3sSettings.sBucket.empty()) {
    throw std::runtime_error("S3 bucket name cannot be empty");
  }
  // The signer holds its own copy
  OPENSSL_cleanse(_s3sSettings.sSecretAccessKey.data(), _s3sSettings.sSecretAccessKey.size());
  _s3sSettings.sSecretAccessKey.clear();

  if (_s3sSettings.oEndpoint) {
    while (!_s3sSettings.oEndpoint->empty() && _s3sSettings.oEndpoint->back() == '/') {
      _s3sSettings.oEndpoint->pop_back();
    }
  }
}

S3ArtifactStore::~S3ArtifactStore() = default;

std::string S3ArtifactStore::origin() const {
  if (_s3sSettings.oEndpoint) {
    return *_s3sSettings.oEndpoint;
  }
  return "https://" + _s3sSettings.sBucket + ".s3." + _s3sSettings.sRegion + ".amazonaws.com";
}

std::pair<std::string, std::string> S3ArtifactStore::locate(const std::string& sKey) const {
  const std::string sEncodedKey = AwsSigV4Signer::uriEncode(sKey, /*bKeepSlash=*/true);

  if (_s3sSettings.oEndpoint) {
    std::string sHost = *_s3sSettings.oEndpoint;
    const auto nScheme = sHost.find("://");
    if (nScheme != std::string::npos) {
      sHost = sHost.substr(nScheme + 3);
    }
    std::string sUri = "/" + _s3sSettings.sBucket;
    if (!sKey.empty()) sUri += "/" + sEncodedKey;
    return {sHost, sUri};
  }

  return {_s3sSettings.sBucket + ".s3." + _s3sSettings.sRegion + ".amazonaws.com",
          "/" + sEncodedKey};
}

std::string S3ArtifactStore::objectUrl(const std::string& sKey) const {
  return origin() + locate(sKey).second;
}

common::HttpResponse S3ArtifactStore::send(const std::string& sMethod, const std::string& sKey,
                                           const std::string& sQuery, const std::string& sBody,
                                           std::map<std::string, std::string> mapHeaders) {
  const auto [sHost, sUri] = locate(sKey);
  const std::string sPayloadHash = AwsSigV4Signer::sha256Hex(sBody);

  mapHeaders["host"] = sHost;
  mapHeaders["x-amz-content-sha256"] = sPayloadHash;
  mapHeaders["x-amz-date"] = AwsSigV4Signer::amzDate(_fnNow());
  if (_s3sSettings.oSessionToken) {
    mapHeaders["x-amz-security-token"] = *_s3sSettings.oSessionToken;
  }
  const std::string sCanonicalQuery = sQuery.empty() ? "" : sQuery + "=";
  const std::string sAuthorization =
      _sigSigner.authorization(sMethod, sUri, sCanonicalQuery, mapHeaders, sPayloadHash);

  common::HttpRequest hreq;
  hreq.sMethod = sMethod;
  hreq.sUrl = origin() + sUri + (sQuery.empty() ? "" : "?" + sQuery);
  hreq.mapHeaders = std::move(mapHeaders);
  hreq.mapHeaders.erase("host");  // curl derives it from the URL
  hreq.mapHeaders["authorization"] = sAuthorization;
  hreq.sBody = sBody;
  hreq.durTimeout = _s3sSettings.durTimeout;

  return _hcClient.perform(hreq);
}

std::vector<std::string> S3ArtifactStore::upload(const std::vector<std::filesystem::path>& vFiles,
                                                 const std::string& sDestinationPrefix) {
  auto spLog = common::Logger::get();
  std::vector<std::string> vUrls;
  vUrls.reserve(vFiles.size());

  for (const auto& pathFile : vFiles) {
    const std::string sKey = sDestinationPrefix + "/" + pathFile.filename().string();
    const std::string sBody = readFile(pathFile);

    common::HttpResponse hres;
    try {
      hres = send("PUT", sKey, "", sBody,
                  {{"content-type", "application/octet-stream"}, {"x-amz-acl", "public-read"}});
    } catch (const std::runtime_error& ex) {
      throw common::StorageError("upload_failed", "Upload of " + sKey + " failed: " + ex.what());
    }

    if (!hres.isSuccess()) {
      throw common::StorageError(
          "upload_failed", "Upload of " + sKey + " rejected with HTTP " +
                               std::to_string(hres.iStatus) + ": " +
                               errorMessage(hres.sBody));
    }

    spLog->info("Uploaded {} ({} bytes) to s3://{}/{}", pathFile.filename().string(),
                sBody.size(), _s3sSettings.sBucket, sKey);
    vUrls.push_back(objectUrl(sKey));
  }
  return vUrls;
}

void S3ArtifactStore::deleteByKeys(const std::vector<std::string>& vKeys) {
  if (vKeys.empty()) return;
  if (vKeys.size() > kMaxDeleteBatch) {
    throw common::StorageError(
        "batch_too_large", "DeleteObjects accepts at most " + std::to_string(kMaxDeleteBatch) +
                               " keys (got " + std::to_string(vKeys.size()) + ")");
  }

  const std::string sBody = buildDeleteBody(vKeys);
  common::HttpResponse hres;
  try {
    hres = send("POST", "", "delete", sBody,
                {{"content-md5", AwsSigV4Signer::md5Base64(sBody)},
                 {"content-type", "application/xml"}});
  } catch (const std::runtime_error& ex) {
    throw common::StorageError("delete_failed", std::string("DeleteObjects failed: ") + ex.what());
  }

  if (!hres.isSuccess()) {
    throw common::StorageError(
        "delete_failed", "DeleteObjects rejected with HTTP " + std::to_string(hres.iStatus) +
                             ": " + errorMessage(hres.sBody));
  }

  const auto vFailed = parseDeleteErrors(hres.sBody);
  if (!vFailed.empty()) {
    std::string sKeys;
    for (const auto& sKey : vFailed) {
      if (!sKeys.empty()) sKeys += ", ";
      sKeys += sKey;
    }
    throw common::StorageError("delete_failed", "Store refused to delete: " + sKeys);
  }

  common::Logger::get()->debug("Deleted {} objects from s3://{}", vKeys.size(),
                               _s3sSettings.sBucket);
}

std::string S3ArtifactStore::buildDeleteBody(const std::vector<std::string>& vKeys) {
  tinyxml2::XMLPrinter printer(nullptr, /*compact=*/true);
  printer.PushDeclaration("xml version=\"1.0\" encoding=\"UTF-8\"");
  printer.OpenElement("Delete", true);
  printer.PushAttribute("xmlns", "http://s3.amazonaws.com/doc/2006-03-01/");
  printer.OpenElement("Quiet", true);
  printer.PushText("true");
  printer.CloseElement(true);
  for (const auto& sKey : vKeys) {
    printer.OpenElement("Object", true);
    printer.OpenElement("Key", true);
    printer.PushText(sKey.c_str());
    printer.CloseElement(true);
    printer.CloseElement(true);
  }
  printer.CloseElement(true);
  return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
}

std::vector<std::string> S3ArtifactStore::parseDeleteErrors(const std::string& sResponseBody) {
  std::vector<std::string> vKeys;
  if (sResponseBody.find_first_not_of(" \t\r\n") == std::string::npos) return vKeys;

  tinyxml2::XMLDocument doc;
  if (doc.Parse(sResponseBody.c_str(), sResponseBody.size()) != tinyxml2::XML_SUCCESS) {
    throw common::StorageError("delete_failed", std::string("Malformed DeleteObjects response: ") +
                                                    doc.ErrorStr());
  }
  const auto* pRoot = doc.RootElement();
  if (!pRoot) return vKeys;

  for (const auto* pChild = pRoot->FirstChildElement(); pChild;
       pChild = pChild->NextSiblingElement()) {
    if (std::strcmp(localName(pChild), "Error") == 0) {
      vKeys.push_back(childText(pChild, "Key"));
    }
  }
  return vKeys;
}

}  // namespace sbu::storage

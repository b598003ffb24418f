#include "upstream/ResponseCache.hpp"

#include "common/Logger.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sbu::upstream {

namespace {

std::string sha256Hex(const std::string& sInput) {
  unsigned char vDigest[EVP_MAX_MD_SIZE];
  unsigned int uLen = 0;
  if (EVP_Digest(sInput.data(), sInput.size(), vDigest, &uLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 computation failed");
  }
  std::ostringstream oss;
  for (unsigned int i = 0; i < uLen; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(vDigest[i]);
  }
  return oss.str();
}

}  // anonymous namespace

ResponseCache::ResponseCache(std::filesystem::path pathDir) : _pathDir(std::move(pathDir)) {}
ResponseCache::~ResponseCache() = default;

std::filesystem::path ResponseCache::entryPath(const std::string& sUrl) const {
  return _pathDir / (sha256Hex(sUrl) + ".json");
}

std::optional<CacheEntry> ResponseCache::load(const std::string& sUrl) const {
  std::ifstream ifs(entryPath(sUrl));
  if (!ifs.is_open()) {
    return std::nullopt;
  }

  const auto j = nlohmann::json::parse(ifs, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object() || !j.contains("etag") || !j.contains("body") ||
      !j["etag"].is_string() || !j["body"].is_string()) {
    common::Logger::get()->warn("Ignoring corrupt response cache entry for {}", sUrl);
    return std::nullopt;
  }
  return CacheEntry{j["etag"].get<std::string>(), j["body"].get<std::string>()};
}

void ResponseCache::store(const std::string& sUrl, const CacheEntry& ce) const {
  std::error_code ec;
  std::filesystem::create_directories(_pathDir, ec);
  if (ec) {
    common::Logger::get()->warn("Cannot create response cache dir {}: {}", _pathDir.string(),
                                ec.message());
    return;
  }

  const auto pathEntry = entryPath(sUrl);
  const auto pathTmp = std::filesystem::path(pathEntry.string() + ".tmp");
  {
    std::ofstream ofs(pathTmp, std::ios::trunc);
    if (!ofs) {
      common::Logger::get()->warn("Cannot write response cache entry {}", pathTmp.string());
      return;
    }
    ofs << nlohmann::json{{"url", sUrl}, {"etag", ce.sEtag}, {"body", ce.sBody}}.dump();
  }

  std::filesystem::rename(pathTmp, pathEntry, ec);
  if (ec) {
    common::Logger::get()->warn("Cannot publish response cache entry {}: {}",
                                pathEntry.string(), ec.message());
  }
}

}  // namespace sbu::upstream

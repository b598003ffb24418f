#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sbu::upstream {

/// Cached body of a conditional GET.
/// Class abbreviation: ce
struct CacheEntry {
  std::string sEtag;
  std::string sBody;
};

/// ETag-keyed on-disk cache for upstream API responses.
/// One JSON file per request URL, named after the URL's SHA-256.
/// Unreadable or corrupt entries are treated as misses.
/// Class abbreviation: rc
class ResponseCache {
 public:
  explicit ResponseCache(std::filesystem::path pathDir);
  ~ResponseCache();

  std::optional<CacheEntry> load(const std::string& sUrl) const;

  /// Best effort: a failed write is logged and the response is still used.
  void store(const std::string& sUrl, const CacheEntry& ce) const;

 private:
  std::filesystem::path entryPath(const std::string& sUrl) const;

  std::filesystem::path _pathDir;
};

}  // namespace sbu::upstream

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "upstream/IReleaseSource.hpp"
#include "upstream/ResponseCache.hpp"

namespace sbu::common {
class HttpClient;
}

namespace sbu::upstream {

/// Connection settings for the GitHub REST API.
/// Class abbreviation: gs
struct GitHubSettings {
  std::string sApiUrl = "https://api.github.com";
  std::optional<std::string> oToken;
  std::string sCacheDir = "/tmp/github-api-cache";
  std::chrono::seconds durTimeout{60};
};

/// Lists releases through GET /repos/{owner}/{repo}/releases, following
/// pagination and revalidating every page against the ETag cache.
/// Class abbreviation: grs
class GitHubReleaseSource : public IReleaseSource {
 public:
  GitHubReleaseSource(common::HttpClient& hcClient, GitHubSettings gsSettings);
  ~GitHubReleaseSource() override;

  std::vector<common::UpstreamRelease> fetchReleases(const std::string& sOwner,
                                                     const std::string& sRepo) override;

  /// Decode one page of the releases listing. Drafts (null published_at)
  /// are skipped. Throws UpstreamFetchError on malformed JSON.
  static std::vector<common::UpstreamRelease> parseReleases(const std::string& sBody);

  /// "2024-01-10T00:00:00Z" -> unix seconds. Throws UpstreamFetchError.
  static int64_t parseTimestamp(const std::string& sIso8601);

  /// URL tagged rel="next" in an RFC 8288 Link header, if any.
  static std::optional<std::string> nextPageUrl(const std::string& sLinkHeader);

 private:
  /// GET one page, honoring the cache. Returns the body and the Link header.
  std::pair<std::string, std::string> fetchPage(const std::string& sUrl);

  common::HttpClient& _hcClient;
  GitHubSettings _gsSettings;
  ResponseCache _rcCache;
};

}  // namespace sbu::upstream

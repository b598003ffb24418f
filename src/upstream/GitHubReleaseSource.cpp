#include "upstream/GitHubReleaseSource.hpp"

#include "common/Errors.hpp"
#include "common/HttpClient.hpp"
#include "common/Logger.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sbu::upstream {

namespace {

constexpr int kPerPage = 100;
constexpr int kMaxPages = 50;

std::string stringOr(const nlohmann::json& j, const char* pKey, const std::string& sDefault) {
  if (!j.contains(pKey) || !j[pKey].is_string()) return sDefault;
  return j[pKey].get<std::string>();
}

}  // anonymous namespace

GitHubReleaseSource::GitHubReleaseSource(common::HttpClient& hcClient, GitHubSettings gsSettings)
    : _hcClient(hcClient),
      _gsSettings(std::move(gsSettings)),
      _rcCache(_gsSettings.sCacheDir) {}

GitHubReleaseSource::~GitHubReleaseSource() = default;

std::vector<common::UpstreamRelease> GitHubReleaseSource::fetchReleases(
    const std::string& sOwner, const std::string& sRepo) {
  std::string sUrl = _gsSettings.sApiUrl + "/repos/" + sOwner + "/" + sRepo +
                     "/releases?per_page=" + std::to_string(kPerPage);

  std::vector<common::UpstreamRelease> vReleases;
  for (int iPage = 0; iPage < kMaxPages; ++iPage) {
    auto [sBody, sLink] = fetchPage(sUrl);
    auto vPage = parseReleases(sBody);
    vReleases.insert(vReleases.end(), std::make_move_iterator(vPage.begin()),
                     std::make_move_iterator(vPage.end()));

    auto oNext = nextPageUrl(sLink);
    if (!oNext) {
      common::Logger::get()->info("Fetched {} releases of {}/{}", vReleases.size(), sOwner,
                                  sRepo);
      return vReleases;
    }
    sUrl = *oNext;
  }

  throw common::UpstreamFetchError(
      "too_many_pages",
      "Release listing of " + sOwner + "/" + sRepo + " exceeds " + std::to_string(kMaxPages) +
          " pages");
}

std::pair<std::string, std::string> GitHubReleaseSource::fetchPage(const std::string& sUrl) {
  common::HttpRequest hreq;
  hreq.sUrl = sUrl;
  hreq.durTimeout = _gsSettings.durTimeout;
  hreq.mapHeaders["Accept"] = "application/vnd.github+json";
  hreq.mapHeaders["User-Agent"] = "svn-buddy-updater";
  hreq.mapHeaders["X-GitHub-Api-Version"] = "2022-11-28";
  if (_gsSettings.oToken) {
    hreq.mapHeaders["Authorization"] = "Bearer " + *_gsSettings.oToken;
  }

  const auto oCached = _rcCache.load(sUrl);
  if (oCached && !oCached->sEtag.empty()) {
    hreq.mapHeaders["If-None-Match"] = oCached->sEtag;
  }

  common::HttpResponse hres;
  try {
    hres = _hcClient.perform(hreq);
  } catch (const std::runtime_error& ex) {
    throw common::UpstreamFetchError("upstream_unreachable", ex.what());
  }

  if (hres.iStatus == 304 && oCached) {
    common::Logger::get()->debug("Release listing not modified, served from cache: {}", sUrl);
    return {oCached->sBody, hres.header("link")};
  }

  if (hres.iStatus == 429 ||
      (hres.iStatus == 403 && hres.header("x-ratelimit-remaining") == "0")) {
    throw common::UpstreamFetchError(
        "rate_limited", "GitHub API rate limit exceeded (reset at " +
                            hres.header("x-ratelimit-reset") + ")");
  }
  if (hres.iStatus == 401 || hres.iStatus == 403) {
    throw common::UpstreamFetchError(
        "upstream_rejected", "GitHub API rejected the request with HTTP " +
                                 std::to_string(hres.iStatus));
  }
  if (!hres.isSuccess()) {
    throw common::UpstreamFetchError(
        "upstream_error", "GitHub API returned HTTP " + std::to_string(hres.iStatus) +
                              " for " + sUrl);
  }

  const std::string sEtag = hres.header("etag");
  if (!sEtag.empty()) {
    _rcCache.store(sUrl, CacheEntry{sEtag, hres.sBody});
  }
  return {hres.sBody, hres.header("link")};
}

std::vector<common::UpstreamRelease> GitHubReleaseSource::parseReleases(
    const std::string& sBody) {
  const auto jRoot = nlohmann::json::parse(sBody, nullptr, /*allow_exceptions=*/false);
  if (jRoot.is_discarded() || !jRoot.is_array()) {
    throw common::UpstreamFetchError("malformed_response",
                                     "Release listing is not a JSON array");
  }

  auto spLog = common::Logger::get();
  std::vector<common::UpstreamRelease> vReleases;
  vReleases.reserve(jRoot.size());

  for (const auto& jRelease : jRoot) {
    if (!jRelease.is_object()) {
      throw common::UpstreamFetchError("malformed_response", "Release entry is not an object");
    }

    std::string sName = stringOr(jRelease, "name", "");
    if (sName.empty()) {
      sName = stringOr(jRelease, "tag_name", "");
    }
    if (sName.empty()) {
      throw common::UpstreamFetchError("malformed_response",
                                       "Release entry has neither name nor tag_name");
    }

    const std::string sPublishedAt = stringOr(jRelease, "published_at", "");
    if (sPublishedAt.empty()) {
      spLog->warn("Skipping unpublished (draft) release '{}'", sName);
      continue;
    }

    common::UpstreamRelease ur;
    ur.sName = std::move(sName);
    ur.iPublishedAt = parseTimestamp(sPublishedAt);

    if (jRelease.contains("assets") && jRelease["assets"].is_array()) {
      for (const auto& jAsset : jRelease["assets"]) {
        ur.vAssets.push_back(common::UpstreamAsset{
            stringOr(jAsset, "name", ""),
            stringOr(jAsset, "browser_download_url", ""),
        });
      }
    }
    vReleases.push_back(std::move(ur));
  }
  return vReleases;
}

int64_t GitHubReleaseSource::parseTimestamp(const std::string& sIso8601) {
  std::tm tm{};
  std::istringstream iss(sIso8601);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    throw common::UpstreamFetchError("malformed_response",
                                     "Unparseable timestamp '" + sIso8601 + "'");
  }

  // Optional fractional seconds, then 'Z' (GitHub always reports UTC)
  std::string sRest;
  std::getline(iss, sRest);
  if (!sRest.empty() && sRest.front() == '.') {
    const auto nEnd = sRest.find_first_not_of("0123456789", 1);
    sRest = nEnd == std::string::npos ? std::string{} : sRest.substr(nEnd);
  }
  if (sRest != "Z" && sRest != "+00:00" && !sRest.empty()) {
    throw common::UpstreamFetchError("malformed_response",
                                     "Non-UTC timestamp '" + sIso8601 + "'");
  }

  return static_cast<int64_t>(timegm(&tm));
}

std::optional<std::string> GitHubReleaseSource::nextPageUrl(const std::string& sLinkHeader) {
  // <https://api.github.com/...&page=2>; rel="next", <...>; rel="last"
  size_t nPos = 0;
  while (nPos < sLinkHeader.size()) {
    const auto nOpen = sLinkHeader.find('<', nPos);
    if (nOpen == std::string::npos) break;
    const auto nClose = sLinkHeader.find('>', nOpen);
    if (nClose == std::string::npos) break;

    auto nEnd = sLinkHeader.find(',', nClose);
    if (nEnd == std::string::npos) nEnd = sLinkHeader.size();

    const std::string sParams = sLinkHeader.substr(nClose + 1, nEnd - nClose - 1);
    if (sParams.find("rel=\"next\"") != std::string::npos) {
      return sLinkHeader.substr(nOpen + 1, nClose - nOpen - 1);
    }
    nPos = nEnd + 1;
  }
  return std::nullopt;
}

}  // namespace sbu::upstream

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sbu::common {

/// Release channel. No other channel exists.
enum class Stability { Stable, Snapshot };

/// Downloadable artifact produced for every release.
enum class ArtifactKind { Binary, Signature };

/// Catalog row.
/// Class abbreviation: rel
struct Release {
  std::string sVersionName;
  int64_t iReleaseDate = 0;  // unix seconds
  std::string sPharUrl;
  std::string sSignatureUrl;
  Stability stability = Stability::Stable;
};

/// Downloadable asset attached to an upstream release.
/// Class abbreviation: ua
struct UpstreamAsset {
  std::string sName;
  std::string sUrl;
};

/// Published release as reported by the upstream release API.
/// Class abbreviation: ur
struct UpstreamRelease {
  std::string sName;
  int64_t iPublishedAt = 0;
  std::vector<UpstreamAsset> vAssets;
};

/// Commit selected for a snapshot release.
/// Class abbreviation: ci
struct CommitInfo {
  std::string sHash;
  int64_t iCommittedAt = 0;
};

/// Entry of the update-check response for one stability channel.
/// Class abbreviation: lv
struct LatestVersion {
  std::string sPath;
  std::string sVersion;
  int iMinPhpVersion = 0;
};

}  // namespace sbu::common

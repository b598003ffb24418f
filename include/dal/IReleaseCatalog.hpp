#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sbu::dal {

/// Typed accessor over the releases table. No business logic.
class IReleaseCatalog {
 public:
  virtual ~IReleaseCatalog() = default;

  /// Delete every stable row and insert vReleases in one transaction.
  /// Readers never observe an empty stable channel; any failure rolls back.
  virtual void replaceStableReleases(const std::vector<common::Release>& vReleases) = 0;

  virtual std::optional<common::Release> findSnapshotByVersion(const std::string& sVersion) = 0;

  /// Throws DuplicateVersionError when the version name already exists.
  virtual void insertSnapshot(const common::Release& rel) = 0;

  /// Newest row per stability present. Equal release dates resolve to the
  /// lexicographically greatest version name.
  virtual std::map<common::Stability, common::Release> latestPerStability() = 0;

  /// Snapshot version names with release_date < iCutoff, excluding
  /// sExcludingVersion, oldest first (version name breaks ties).
  virtual std::vector<std::string> snapshotsOlderThan(int64_t iCutoff,
                                                      const std::string& sExcludingVersion) = 0;

  /// Returns the number of rows deleted.
  virtual int deleteVersions(const std::vector<std::string>& vVersionNames) = 0;

  /// Stored URL for the artifact, or empty string when no row matches.
  virtual std::string downloadUrl(const std::string& sVersion, common::ArtifactKind kind) = 0;
};

}  // namespace sbu::dal

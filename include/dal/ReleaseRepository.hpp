#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "dal/IReleaseCatalog.hpp"

namespace sbu::dal {

class ConnectionPool;

/// PostgreSQL implementation of the release catalog.
/// Class abbreviation: rr
class ReleaseRepository : public IReleaseCatalog {
 public:
  explicit ReleaseRepository(ConnectionPool& cpPool);
  ~ReleaseRepository() override;

  /// Create the releases table if it does not exist yet.
  void ensureSchema();

  void replaceStableReleases(const std::vector<common::Release>& vReleases) override;
  std::optional<common::Release> findSnapshotByVersion(const std::string& sVersion) override;
  void insertSnapshot(const common::Release& rel) override;
  std::map<common::Stability, common::Release> latestPerStability() override;
  std::vector<std::string> snapshotsOlderThan(int64_t iCutoff,
                                              const std::string& sExcludingVersion) override;
  int deleteVersions(const std::vector<std::string>& vVersionNames) override;
  std::string downloadUrl(const std::string& sVersion, common::ArtifactKind kind) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace sbu::dal

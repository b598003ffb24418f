#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sbu::build {
class IArtifactBuilder;
}
namespace sbu::dal {
class IReleaseCatalog;
}
namespace sbu::scm {
class ISourceControl;
}
namespace sbu::storage {
class IArtifactStore;
}
namespace sbu::upstream {
class IReleaseSource;
}

namespace sbu::core {

/// Everything the orchestrator needs to know, fixed at construction.
/// Class abbreviation: ss
struct SyncSettings {
  std::string sUpstreamOwner = "console-helpers";
  std::string sUpstreamRepo = "svn-buddy";
  std::string sBranch = "master";
  std::filesystem::path pathSnapshotsDir;
  std::string sSnapshotPrefix = "snapshots";
  std::chrono::seconds durRetention = std::chrono::hours(24 * 21);
  int iMinPhpVersion = 50300;
  std::function<std::chrono::system_clock::time_point()> fnNow = std::chrono::system_clock::now;
};

/// Outcome of one syncStable() pass.
/// Class abbreviation: ssr
struct StableSyncResult {
  size_t nReleases = 0;
};

/// Outcome of one syncSnapshot() pass.
/// Class abbreviation: snr
struct SnapshotSyncResult {
  std::string sCommit;
  bool bCreated = false;  // false = commit already in the catalog
  std::vector<std::string> vExpired;
};

/// Reconciles the release catalog with the upstream release API, the
/// source repository and the artifact bucket.
///
/// Two independent flows:
///   syncStable():   fetch upstream, then replace the stable channel in one
///                   transaction.
///   syncSnapshot(): pick last week's commit, build and upload it once,
///                   record it, then sweep expired snapshots.
///
/// Any failure aborts the pass and propagates. Every step is safe to re-run.
/// Class abbreviation: rso
class ReleaseSyncOrchestrator {
 public:
  ReleaseSyncOrchestrator(dal::IReleaseCatalog& catalog, upstream::IReleaseSource& source,
                          scm::ISourceControl& scmRepo, build::IArtifactBuilder& builder,
                          storage::IArtifactStore& store, SyncSettings ssSettings);
  ~ReleaseSyncOrchestrator();

  StableSyncResult syncStable(std::stop_token stToken = {});

  /// Serialized: concurrent callers wait for the running pass.
  SnapshotSyncResult syncSnapshot(std::stop_token stToken = {});

  /// Delete snapshots older than the retention window, except the newest one.
  /// Objects go first, then catalog rows. A version whose objects could not
  /// be deleted keeps its row; the others are still removed, then
  /// StorageError is thrown. Returns the versions removed.
  std::vector<std::string> sweepExpiredSnapshots();

  /// Update-check payload: the newest release of every stability present.
  std::map<common::Stability, common::LatestVersion> latestVersionsForStability();

  /// Stored URL of sFileName for sVersion; empty for unknown files or versions.
  std::string downloadUrl(const std::string& sVersion, const std::string& sFileName);

  /// Map upstream releases onto stable catalog rows.
  static std::vector<common::Release> toStableReleases(
      const std::vector<common::UpstreamRelease>& vUpstream);

 private:
  std::vector<std::string> objectKeysFor(const std::string& sVersion) const;

  dal::IReleaseCatalog& _catalog;
  upstream::IReleaseSource& _source;
  scm::ISourceControl& _scmRepo;
  build::IArtifactBuilder& _builder;
  storage::IArtifactStore& _store;
  SyncSettings _ssSettings;
  std::mutex _mtxSnapshot;
};

}  // namespace sbu::core

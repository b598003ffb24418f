#include "core/ReleaseSyncOrchestrator.hpp"

#include "build/IArtifactBuilder.hpp"
#include "common/Artifacts.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/ScopedDirectory.hpp"
#include "dal/IReleaseCatalog.hpp"
#include "scm/ISourceControl.hpp"
#include "storage/IArtifactStore.hpp"
#include "upstream/IReleaseSource.hpp"

namespace sbu::core {

namespace {

void throwIfStopRequested(const std::stop_token& stToken, const std::string& sStep) {
  if (stToken.stop_requested()) {
    throw common::CancelledError("sync_cancelled", "Sync pass cancelled before " + sStep);
  }
}

int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // anonymous namespace

ReleaseSyncOrchestrator::ReleaseSyncOrchestrator(dal::IReleaseCatalog& catalog,
                                                 upstream::IReleaseSource& source,
                                                 scm::ISourceControl& scmRepo,
                                                 build::IArtifactBuilder& builder,
                                                 storage::IArtifactStore& store,
                                                 SyncSettings ssSettings)
    : _catalog(catalog),
      _source(source),
      _scmRepo(scmRepo),
      _builder(builder),
      _store(store),
      _ssSettings(std::move(ssSettings)) {}

ReleaseSyncOrchestrator::~ReleaseSyncOrchestrator() = default;

// ── Stable channel ─────────────────────────────────────────────────────────

std::vector<common::Release> ReleaseSyncOrchestrator::toStableReleases(
    const std::vector<common::UpstreamRelease>& vUpstream) {
  std::vector<common::Release> vReleases;
  vReleases.reserve(vUpstream.size());

  for (const auto& ur : vUpstream) {
    common::Release rel;
    rel.sVersionName = ur.sName;
    rel.iReleaseDate = ur.iPublishedAt;
    rel.stability = common::Stability::Stable;

    for (const auto& ua : ur.vAssets) {
      if (auto oKind = common::artifactKindFromFileName(ua.sName)) {
        common::setArtifactUrl(rel, *oKind, ua.sUrl);
      }
    }
    vReleases.push_back(std::move(rel));
  }
  return vReleases;
}

StableSyncResult ReleaseSyncOrchestrator::syncStable(std::stop_token stToken) {
  auto spLog = common::Logger::get();
  spLog->info("Stable sync: fetching releases of {}/{}", _ssSettings.sUpstreamOwner,
              _ssSettings.sUpstreamRepo);

  const auto vUpstream =
      _source.fetchReleases(_ssSettings.sUpstreamOwner, _ssSettings.sUpstreamRepo);
  const auto vReleases = toStableReleases(vUpstream);

  throwIfStopRequested(stToken, "replacing stable releases");
  _catalog.replaceStableReleases(vReleases);

  spLog->info("Stable sync: catalog now holds {} stable releases", vReleases.size());
  return StableSyncResult{vReleases.size()};
}

// ── Snapshot channel ───────────────────────────────────────────────────────

SnapshotSyncResult ReleaseSyncOrchestrator::syncSnapshot(std::stop_token stToken) {
  std::lock_guard<std::mutex> lock(_mtxSnapshot);
  auto spLog = common::Logger::get();
  SnapshotSyncResult snr;

  // Step 1: refresh the working copy
  throwIfStopRequested(stToken, "updating the working copy");
  _scmRepo.checkout(_ssSettings.sBranch);
  _scmRepo.pull();

  // Step 2: last week's commit
  const auto oCommit = _scmRepo.findCommitBeforeWeeklyCutoff(_ssSettings.fnNow());
  if (!oCommit) {
    throw common::NoEligibleCommitError(
        "no_eligible_commit",
        "No commit on '" + _ssSettings.sBranch + "' precedes this week's Monday");
  }
  snr.sCommit = oCommit->sHash;

  // Step 3: idempotency check
  if (_catalog.findSnapshotByVersion(oCommit->sHash)) {
    spLog->info("Snapshot sync: {} already released, skipping build", oCommit->sHash);
  } else {
    // Step 4: build into a per-commit directory removed after upload
    throwIfStopRequested(stToken, "building " + oCommit->sHash);
    common::ScopedDirectory sdOutput(_ssSettings.pathSnapshotsDir / oCommit->sHash);
    const auto ba = _builder.build(oCommit->sHash, sdOutput.path());

    // Step 5: upload, then record. No row is written unless every upload succeeded.
    throwIfStopRequested(stToken, "uploading " + oCommit->sHash);
    const auto vUrls = _store.upload({ba.pathBinary, ba.pathSignature},
                                     _ssSettings.sSnapshotPrefix + "/" + oCommit->sHash);
    if (vUrls.size() != 2) {
      throw common::StorageError("upload_failed",
                                 "Expected 2 artifact URLs, got " + std::to_string(vUrls.size()));
    }

    throwIfStopRequested(stToken, "recording " + oCommit->sHash);
    common::Release rel;
    rel.sVersionName = oCommit->sHash;
    rel.iReleaseDate = oCommit->iCommittedAt;
    rel.sPharUrl = vUrls[0];
    rel.sSignatureUrl = vUrls[1];
    rel.stability = common::Stability::Snapshot;
    _catalog.insertSnapshot(rel);

    snr.bCreated = true;
    spLog->info("Snapshot sync: released {}", oCommit->sHash);
  }

  // Step 6: retention
  throwIfStopRequested(stToken, "sweeping expired snapshots");
  snr.vExpired = sweepExpiredSnapshots();
  return snr;
}

std::vector<std::string> ReleaseSyncOrchestrator::objectKeysFor(
    const std::string& sVersion) const {
  const std::string sFolder = _ssSettings.sSnapshotPrefix + "/" + sVersion;
  std::vector<std::string> vKeys;
  for (const auto kind : common::kAllArtifactKinds) {
    vKeys.push_back(sFolder + "/" + common::artifactFileName(kind));
  }
  vKeys.push_back(sFolder);  // folder marker
  return vKeys;
}

std::vector<std::string> ReleaseSyncOrchestrator::sweepExpiredSnapshots() {
  auto spLog = common::Logger::get();

  const auto mapLatest = _catalog.latestPerStability();
  const auto itLatest = mapLatest.find(common::Stability::Snapshot);
  if (itLatest == mapLatest.end()) {
    return {};
  }

  const int64_t iCutoff = toUnixSeconds(_ssSettings.fnNow() - _ssSettings.durRetention);
  const auto vExpired = _catalog.snapshotsOlderThan(iCutoff, itLatest->second.sVersionName);
  if (vExpired.empty()) {
    return {};
  }

  std::vector<std::string> vRemovable;
  std::vector<std::string> vFailed;
  for (const auto& sVersion : vExpired) {
    try {
      _store.deleteByKeys(objectKeysFor(sVersion));
      vRemovable.push_back(sVersion);
    } catch (const common::StorageError& ex) {
      spLog->error("Retention: keeping {} in the catalog, object deletion failed: {}", sVersion,
                   ex.what());
      vFailed.push_back(sVersion);
    }
  }

  if (!vRemovable.empty()) {
    _catalog.deleteVersions(vRemovable);
    spLog->info("Retention: removed {} expired snapshots (newest kept: {})", vRemovable.size(),
                itLatest->second.sVersionName);
  }

  if (!vFailed.empty()) {
    std::string sVersions;
    for (const auto& sVersion : vFailed) {
      if (!sVersions.empty()) sVersions += ", ";
      sVersions += sVersion;
    }
    throw common::StorageError("retention_incomplete",
                               "Could not delete objects of expired snapshots: " + sVersions);
  }
  return vRemovable;
}

// ── Query surface ──────────────────────────────────────────────────────────

std::map<common::Stability, common::LatestVersion>
ReleaseSyncOrchestrator::latestVersionsForStability() {
  std::map<common::Stability, common::LatestVersion> mapVersions;
  for (const auto& [stability, rel] : _catalog.latestPerStability()) {
    mapVersions.emplace(stability,
                        common::LatestVersion{
                            "/download/" + rel.sVersionName + "/" +
                                common::artifactFileName(common::ArtifactKind::Binary),
                            rel.sVersionName,
                            _ssSettings.iMinPhpVersion,
                        });
  }
  return mapVersions;
}

std::string ReleaseSyncOrchestrator::downloadUrl(const std::string& sVersion,
                                                 const std::string& sFileName) {
  const auto oKind = common::artifactKindFromFileName(sFileName);
  if (!oKind) {
    return "";
  }
  return _catalog.downloadUrl(sVersion, *oKind);
}

}  // namespace sbu::core

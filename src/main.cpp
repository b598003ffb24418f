#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "api/ApiServer.hpp"
#include "build/PharBuilder.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/HttpClient.hpp"
#include "common/Logger.hpp"
#include "common/ProcessRunner.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "core/ReleaseSyncOrchestrator.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/ReleaseRepository.hpp"
#include "scm/GitClient.hpp"
#include "storage/S3ArtifactStore.hpp"
#include "upstream/GitHubReleaseSource.hpp"

#include <openssl/crypto.h>

namespace {

void printUsage(const char* pProgram) {
  std::cerr << "Usage: " << pProgram << " [serve|sync-stable|sync-snapshot|sweep]\n"
            << "  serve          run both sync flows on their intervals and serve the\n"
            << "                 update-check API (default)\n"
            << "  sync-stable    replace the stable channel from GitHub once\n"
            << "  sync-snapshot  release this week's snapshot once, then sweep\n"
            << "  sweep          delete expired snapshots once\n";
}

}  // namespace

int main(int argc, char** argv) {
  const std::string sCommand = argc > 1 ? argv[1] : "serve";
  if (argc > 2 || (sCommand != "serve" && sCommand != "sync-stable" &&
                   sCommand != "sync-snapshot" && sCommand != "sweep")) {
    printUsage(argv[0]);
    return EXIT_FAILURE;
  }

  sbu::common::HttpClient::globalInit();
  int iExit = EXIT_SUCCESS;

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = sbu::common::Config::load();

    sbu::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = sbu::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (command={})", sCommand);

    // ── Step 2: Catalog ──────────────────────────────────────────────────
    auto cpPool = std::make_unique<sbu::dal::ConnectionPool>(cfgApp.sDbUrl, cfgApp.iDbPoolSize);
    auto rrCatalog = std::make_unique<sbu::dal::ReleaseRepository>(*cpPool);
    rrCatalog->ensureSchema();
    spLog->info("Step 2: Release catalog ready");

    // ── Step 3: External collaborators ───────────────────────────────────
    const std::chrono::seconds durHttpTimeout(cfgApp.iHttpTimeoutSeconds);
    const std::chrono::seconds durCommandTimeout(cfgApp.iCommandTimeoutSeconds);

    sbu::common::HttpClient hcClient;
    sbu::common::ProcessRunner prRunner;

    sbu::upstream::GitHubSettings gsSettings;
    gsSettings.sApiUrl = cfgApp.sGithubApiUrl;
    gsSettings.oToken = cfgApp.oGithubToken;
    gsSettings.sCacheDir = cfgApp.sGithubCacheDir;
    gsSettings.durTimeout = durHttpTimeout;
    auto grsSource = std::make_unique<sbu::upstream::GitHubReleaseSource>(hcClient, gsSettings);

    auto gcRepo = std::make_unique<sbu::scm::GitClient>(prRunner, cfgApp.sRepoPath,
                                                        durCommandTimeout);
    if (cfgApp.oRepoUrl) {
      gcRepo->ensureCloned(*cfgApp.oRepoUrl);
    }

    sbu::build::BuildSettings bsSettings;
    bsSettings.vBuildCommand = sbu::common::splitCommand(cfgApp.sBuildCommand);
    bsSettings.vPrepareCommand = sbu::common::splitCommand(cfgApp.sBuildPrepareCommand);
    bsSettings.pathTmpDir = cfgApp.sBuildTmpDir;
    bsSettings.durTimeout = durCommandTimeout;
    auto pbBuilder = std::make_unique<sbu::build::PharBuilder>(*gcRepo, prRunner, bsSettings);

    sbu::storage::S3Settings s3sSettings;
    s3sSettings.sBucket = cfgApp.sS3Bucket;
    s3sSettings.sRegion = cfgApp.sS3Region;
    s3sSettings.oEndpoint = cfgApp.oS3Endpoint;
    s3sSettings.sAccessKeyId = cfgApp.sAwsAccessKeyId;
    s3sSettings.sSecretAccessKey = cfgApp.sAwsSecretAccessKey;
    s3sSettings.oSessionToken = cfgApp.oAwsSessionToken;
    s3sSettings.durTimeout = durHttpTimeout;

    // Zero the secret from Config after handoff
    OPENSSL_cleanse(cfgApp.sAwsSecretAccessKey.data(), cfgApp.sAwsSecretAccessKey.size());
    cfgApp.sAwsSecretAccessKey.clear();

    auto s3Store = std::make_unique<sbu::storage::S3ArtifactStore>(hcClient,
                                                                   std::move(s3sSettings));
    spLog->info("Step 3: GitHub, git ({}), build and S3 ({}) clients ready", cfgApp.sRepoPath,
                cfgApp.sS3Bucket);

    // ── Step 4: Orchestrator ─────────────────────────────────────────────
    sbu::core::SyncSettings ssSettings;
    ssSettings.sUpstreamOwner = cfgApp.sGithubOwner;
    ssSettings.sUpstreamRepo = cfgApp.sGithubRepo;
    ssSettings.sBranch = cfgApp.sRepoBranch;
    ssSettings.pathSnapshotsDir = cfgApp.sSnapshotsPath;
    ssSettings.durRetention = std::chrono::hours(24) * cfgApp.iSnapshotRetentionDays;
    ssSettings.iMinPhpVersion = cfgApp.iMinPhpVersion;

    sbu::core::ReleaseSyncOrchestrator rsoOrchestrator(*rrCatalog, *grsSource, *gcRepo,
                                                       *pbBuilder, *s3Store,
                                                       std::move(ssSettings));
    spLog->info("Step 4: ReleaseSyncOrchestrator ready");

    // ── Step 5: Run ──────────────────────────────────────────────────────
    if (sCommand == "sync-stable") {
      rsoOrchestrator.syncStable();
    } else if (sCommand == "sync-snapshot") {
      rsoOrchestrator.syncSnapshot();
    } else if (sCommand == "sweep") {
      const auto vRemoved = rsoOrchestrator.sweepExpiredSnapshots();
      spLog->info("Sweep removed {} snapshots", vRemoved.size());
    } else {
      auto msScheduler = std::make_unique<sbu::core::MaintenanceScheduler>();
      msScheduler->schedule("stable-sync",
                            std::chrono::seconds(cfgApp.iStableSyncIntervalSeconds),
                            [&rsoOrchestrator](std::stop_token stToken) {
                              rsoOrchestrator.syncStable(stToken);
                            });
      msScheduler->schedule("snapshot-sync",
                            std::chrono::seconds(cfgApp.iSnapshotSyncIntervalSeconds),
                            [&rsoOrchestrator](std::stop_token stToken) {
                              rsoOrchestrator.syncSnapshot(stToken);
                            });
      msScheduler->start();
      spLog->info("Step 5: Scheduler started (stable every {}s, snapshot every {}s)",
                  cfgApp.iStableSyncIntervalSeconds, cfgApp.iSnapshotSyncIntervalSeconds);

      // Crow handles SIGINT/SIGTERM and returns from run()
      sbu::api::ApiServer apiServer(rsoOrchestrator);
      apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

      spLog->info("Shutting down: waiting for the running sync pass");
      msScheduler->stop();
    }

    spLog->info("svn-buddy-updater {} finished", sCommand);
  } catch (const sbu::common::AppError& ex) {
    std::cerr << "[fatal] " << sCommand << " failed [" << ex._sErrorCode << "]: " << ex.what()
              << "\n";
    iExit = EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << sCommand << " failed: " << ex.what() << "\n";
    iExit = EXIT_FAILURE;
  }

  sbu::common::Logger::shutdown();
  sbu::common::HttpClient::globalCleanup();
  return iExit;
}

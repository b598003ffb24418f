#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sbu::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvOr(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nParsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nParsed);
  } catch (const std::exception&) {
    nParsed = 0;
  }
  if (nParsed == 0 || nParsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

void Config::requirePositive(const char* pVarName, int iValue) {
  if (iValue < 1) {
    throw std::runtime_error(
        std::string(pVarName) + " must be >= 1 (got " + std::to_string(iValue) + ")");
  }
}

std::string Config::readSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = readSecret(pVarName);
  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + pVarName +
        "_FILE is defined");
  }
  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("SBU_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable SBU_DB_URL is not set");
  }
  cfg.sS3Bucket = getEnv("SBU_S3_BUCKET");
  if (cfg.sS3Bucket.empty()) {
    throw std::runtime_error("Required environment variable SBU_S3_BUCKET is not set");
  }
  cfg.sAwsAccessKeyId = getEnv("SBU_AWS_ACCESS_KEY_ID");
  if (cfg.sAwsAccessKeyId.empty()) {
    throw std::runtime_error("Required environment variable SBU_AWS_ACCESS_KEY_ID is not set");
  }
  cfg.sAwsSecretAccessKey = loadSecret("SBU_AWS_SECRET_ACCESS_KEY");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("SBU_DB_POOL_SIZE", cfg.iDbPoolSize);

  cfg.sS3Region = getEnvOr("SBU_S3_REGION", cfg.sS3Region);
  const std::string sEndpoint = getEnv("SBU_S3_ENDPOINT");
  if (!sEndpoint.empty()) {
    cfg.oS3Endpoint = sEndpoint;
  }
  const std::string sSessionToken = getEnv("SBU_AWS_SESSION_TOKEN");
  if (!sSessionToken.empty()) {
    cfg.oAwsSessionToken = sSessionToken;
  }

  // Upstream
  cfg.sGithubApiUrl = getEnvOr("SBU_GITHUB_API_URL", cfg.sGithubApiUrl);
  cfg.sGithubOwner = getEnvOr("SBU_GITHUB_OWNER", cfg.sGithubOwner);
  cfg.sGithubRepo = getEnvOr("SBU_GITHUB_REPO", cfg.sGithubRepo);
  const std::string sGithubToken = readSecret("SBU_GITHUB_TOKEN");
  if (!sGithubToken.empty()) {
    cfg.oGithubToken = sGithubToken;
  }
  cfg.sGithubCacheDir = getEnvOr("SBU_GITHUB_CACHE_DIR", cfg.sGithubCacheDir);

  // Repository and builds
  const std::string sRepoUrl = getEnv("SBU_REPO_URL");
  if (!sRepoUrl.empty()) {
    cfg.oRepoUrl = sRepoUrl;
  }
  cfg.sRepoPath = getEnvOr("SBU_REPO_PATH", cfg.sRepoPath);
  cfg.sRepoBranch = getEnvOr("SBU_REPO_BRANCH", cfg.sRepoBranch);
  cfg.sSnapshotsPath = getEnvOr("SBU_SNAPSHOTS_PATH", cfg.sSnapshotsPath);
  cfg.sBuildTmpDir = getEnv("SBU_BUILD_TMP_DIR");
  cfg.sBuildCommand = getEnvOr("SBU_BUILD_COMMAND", cfg.sBuildCommand);
  cfg.sBuildPrepareCommand = getEnv("SBU_BUILD_PREPARE_COMMAND");

  // Timeouts
  cfg.iCommandTimeoutSeconds = getEnvInt("SBU_COMMAND_TIMEOUT_SECONDS", cfg.iCommandTimeoutSeconds);
  cfg.iHttpTimeoutSeconds = getEnvInt("SBU_HTTP_TIMEOUT_SECONDS", cfg.iHttpTimeoutSeconds);

  // Release policy
  cfg.iSnapshotRetentionDays = getEnvInt("SBU_SNAPSHOT_RETENTION_DAYS", cfg.iSnapshotRetentionDays);
  cfg.iMinPhpVersion = getEnvInt("SBU_MIN_PHP_VERSION", cfg.iMinPhpVersion);

  // HTTP
  cfg.iHttpPort = getEnvInt("SBU_HTTP_PORT", cfg.iHttpPort);
  cfg.iHttpThreads = getEnvInt("SBU_HTTP_THREADS", cfg.iHttpThreads);

  // Scheduling
  cfg.iStableSyncIntervalSeconds =
      getEnvInt("SBU_STABLE_SYNC_INTERVAL_SECONDS", cfg.iStableSyncIntervalSeconds);
  cfg.iSnapshotSyncIntervalSeconds =
      getEnvInt("SBU_SNAPSHOT_SYNC_INTERVAL_SECONDS", cfg.iSnapshotSyncIntervalSeconds);

  // Logging
  cfg.sLogLevel = getEnvOr("SBU_LOG_LEVEL", cfg.sLogLevel);

  // ── Validation ─────────────────────────────────────────────────────────
  requirePositive("SBU_DB_POOL_SIZE", cfg.iDbPoolSize);
  requirePositive("SBU_COMMAND_TIMEOUT_SECONDS", cfg.iCommandTimeoutSeconds);
  requirePositive("SBU_HTTP_TIMEOUT_SECONDS", cfg.iHttpTimeoutSeconds);
  requirePositive("SBU_SNAPSHOT_RETENTION_DAYS", cfg.iSnapshotRetentionDays);
  requirePositive("SBU_HTTP_THREADS", cfg.iHttpThreads);
  requirePositive("SBU_STABLE_SYNC_INTERVAL_SECONDS", cfg.iStableSyncIntervalSeconds);
  requirePositive("SBU_SNAPSHOT_SYNC_INTERVAL_SECONDS", cfg.iSnapshotSyncIntervalSeconds);

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error(
        "SBU_HTTP_PORT must be in 1..65535 (got " + std::to_string(cfg.iHttpPort) + ")");
  }

  if (cfg.sBuildCommand.find_first_not_of(" \t") == std::string::npos) {
    throw std::runtime_error("SBU_BUILD_COMMAND must not be blank");
  }

  return cfg;
}

}  // namespace sbu::common

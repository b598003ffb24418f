#pragma once

#include <optional>
#include <string>

namespace sbu::common {

/// Environment variable loader for the updater process.
/// Loads all SBU_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  std::string sS3Bucket;
  std::string sAwsAccessKeyId;
  std::string sAwsSecretAccessKey;  // zeroed after handoff to S3ArtifactStore

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 2;

  // ── Object store ──────────────────────────────────────────────────────
  std::string sS3Region = "us-east-1";
  std::optional<std::string> oS3Endpoint;  // path-style S3-compatible endpoint
  std::optional<std::string> oAwsSessionToken;

  // ── Upstream release API ──────────────────────────────────────────────
  std::string sGithubApiUrl = "https://api.github.com";
  std::string sGithubOwner = "console-helpers";
  std::string sGithubRepo = "svn-buddy";
  std::optional<std::string> oGithubToken;
  std::string sGithubCacheDir = "/tmp/github-api-cache";

  // ── Source repository and builds ──────────────────────────────────────
  std::optional<std::string> oRepoUrl;
  std::string sRepoPath = "/var/svn-buddy-updater/repository";
  std::string sRepoBranch = "master";
  std::string sSnapshotsPath = "/var/svn-buddy-updater/snapshots";
  std::string sBuildTmpDir;  // empty = std::filesystem::temp_directory_path()
  std::string sBuildCommand = "bin/svn-buddy dev:phar-create";
  std::string sBuildPrepareCommand;  // empty = no prepare step

  // ── Timeouts ──────────────────────────────────────────────────────────
  int iCommandTimeoutSeconds = 900;
  int iHttpTimeoutSeconds = 60;

  // ── Release policy ────────────────────────────────────────────────────
  int iSnapshotRetentionDays = 21;
  int iMinPhpVersion = 50300;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Scheduling ────────────────────────────────────────────────────────
  int iStableSyncIntervalSeconds = 3600;
  int iSnapshotSyncIntervalSeconds = 86400;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for SBU_AWS_SECRET_ACCESS_KEY and SBU_GITHUB_TOKEN.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  /// Returns empty string when neither is set.
  static std::string readSecret(const char* pVarName);

  /// Same as readSecret() but throws when the secret is absent.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, return sDefault if unset or empty.
  static std::string getEnvOr(const char* pVarName, const std::string& sDefault);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Throw unless iValue >= 1.
  static void requirePositive(const char* pVarName, int iValue);
};

}  // namespace sbu::common

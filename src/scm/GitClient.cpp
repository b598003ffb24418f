#include "scm/GitClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>
#include <system_error>

namespace sbu::scm {

GitClient::GitClient(common::IProcessRunner& prRunner, std::filesystem::path pathRepo,
                     std::chrono::seconds durTimeout)
    : _prRunner(prRunner), _pathRepo(std::move(pathRepo)), _durTimeout(durTimeout) {}

GitClient::~GitClient() = default;

std::string GitClient::git(const std::vector<std::string>& vArgs,
                           const std::string& sErrorCode) {
  common::ProcessSpec psSpec;
  psSpec.vArgs.reserve(vArgs.size() + 1);
  psSpec.vArgs.push_back("git");
  psSpec.vArgs.insert(psSpec.vArgs.end(), vArgs.begin(), vArgs.end());
  psSpec.sWorkingDir = _pathRepo.string();
  psSpec.durTimeout = _durTimeout;

  common::ProcessResult pres;
  try {
    pres = _prRunner.run(psSpec);
  } catch (const std::system_error& ex) {
    throw common::SourceControlError(sErrorCode, std::string("Cannot run git: ") + ex.what());
  }

  if (pres.bTimedOut) {
    throw common::SourceControlError(
        sErrorCode, "Timed out after " + std::to_string(_durTimeout.count()) +
                        "s: " + common::describeCommand(psSpec.vArgs));
  }
  if (pres.iExitCode != 0) {
    throw common::SourceControlError(
        sErrorCode, common::describeCommand(psSpec.vArgs) + " exited with " +
                        std::to_string(pres.iExitCode) + ": " + pres.sStderr);
  }
  return pres.sStdout;
}

void GitClient::ensureCloned(const std::string& sRemoteUrl) {
  if (std::filesystem::exists(_pathRepo / ".git")) {
    return;
  }

  common::Logger::get()->info("Cloning {} into {}", sRemoteUrl, _pathRepo.string());
  std::error_code ec;
  std::filesystem::create_directories(_pathRepo.parent_path(), ec);
  if (ec) {
    throw common::SourceControlError(
        "clone_failed", "Cannot create " + _pathRepo.parent_path().string() + ": " +
                            ec.message());
  }

  common::ProcessSpec psSpec;
  psSpec.vArgs = {"git", "clone", sRemoteUrl, _pathRepo.string()};
  psSpec.durTimeout = _durTimeout;

  common::ProcessResult pres;
  try {
    pres = _prRunner.run(psSpec);
  } catch (const std::system_error& ex) {
    throw common::SourceControlError("clone_failed", std::string("Cannot run git: ") + ex.what());
  }
  if (!pres.succeeded()) {
    throw common::SourceControlError("clone_failed",
                                     "git clone " + sRemoteUrl + " failed: " + pres.sStderr);
  }
}

void GitClient::checkout(const std::string& sRef) {
  git({"checkout", "--quiet", sRef}, "checkout_failed");
}

void GitClient::pull() { git({"pull", "--ff-only", "--quiet"}, "pull_failed"); }

std::optional<common::CommitInfo> GitClient::findCommitBeforeWeeklyCutoff(
    std::chrono::system_clock::time_point tpNow) {
  const std::string sCutoff = weeklyCutoffDate(tpNow);
  // --before is inclusive; the last second of Sunday excludes a commit at midnight
  const int64_t iBefore = weeklyCutoffEpoch(tpNow) - 1;
  const std::string sOutput = git(
      {"log", "--format=%H:%ct", "--max-count=1", "--before=@" + std::to_string(iBefore)},
      "log_failed");

  auto oCommit = parseLogLine(sOutput);
  if (oCommit) {
    common::Logger::get()->debug("Snapshot candidate before {}: {}", sCutoff, oCommit->sHash);
  }
  return oCommit;
}

void GitClient::addWorktree(const std::string& sCommit, const std::filesystem::path& pathDir) {
  git({"worktree", "add", "--detach", "--force", pathDir.string(), sCommit}, "worktree_failed");
}

void GitClient::removeWorktree(const std::filesystem::path& pathDir) {
  git({"worktree", "remove", "--force", pathDir.string()}, "worktree_failed");
}

namespace {

/// Noon on the Monday of tpNow's week, normalized by mktime.
std::tm mondayOfWeek(std::chrono::system_clock::time_point tpNow) {
  const std::time_t tNow = std::chrono::system_clock::to_time_t(tpNow);
  std::tm tmLocal{};
  localtime_r(&tNow, &tmLocal);

  // tm_wday: 0 = Sunday; ISO weeks start on Monday
  const int iDaysSinceMonday = (tmLocal.tm_wday + 6) % 7;
  tmLocal.tm_mday -= iDaysSinceMonday;
  tmLocal.tm_hour = 12;  // away from DST transitions
  tmLocal.tm_min = 0;
  tmLocal.tm_sec = 0;
  tmLocal.tm_isdst = -1;
  std::mktime(&tmLocal);
  return tmLocal;
}

}  // namespace

std::string GitClient::weeklyCutoffDate(std::chrono::system_clock::time_point tpNow) {
  const std::tm tmMonday = mondayOfWeek(tpNow);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tmMonday);
  return buf;
}

int64_t GitClient::weeklyCutoffEpoch(std::chrono::system_clock::time_point tpNow) {
  std::tm tmMidnight = mondayOfWeek(tpNow);
  tmMidnight.tm_hour = 0;
  tmMidnight.tm_isdst = -1;
  return static_cast<int64_t>(std::mktime(&tmMidnight));
}

std::optional<common::CommitInfo> GitClient::parseLogLine(const std::string& sOutput) {
  const auto nFirst = sOutput.find_first_not_of(" \t\r\n");
  if (nFirst == std::string::npos) {
    return std::nullopt;
  }
  const auto nLast = sOutput.find_last_not_of(" \t\r\n");
  const std::string sLine = sOutput.substr(nFirst, nLast - nFirst + 1);

  const auto nColon = sLine.find(':');
  if (nColon == std::string::npos || nColon == 0 || nColon + 1 == sLine.size()) {
    throw common::SourceControlError("log_failed", "Unexpected git log output: '" + sLine + "'");
  }

  const std::string sHash = sLine.substr(0, nColon);
  const std::string sTimestamp = sLine.substr(nColon + 1);
  for (const char c : sHash) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw common::SourceControlError("log_failed", "Not a commit hash: '" + sHash + "'");
    }
  }
  for (const char c : sTimestamp) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw common::SourceControlError("log_failed",
                                       "Not a commit timestamp: '" + sTimestamp + "'");
    }
  }

  try {
    return common::CommitInfo{sHash, std::stoll(sTimestamp)};
  } catch (const std::out_of_range&) {
    throw common::SourceControlError("log_failed",
                                     "Commit timestamp out of range: '" + sTimestamp + "'");
  }
}

}  // namespace sbu::scm

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/ProcessRunner.hpp"
#include "scm/ISourceControl.hpp"

namespace sbu::scm {

/// git CLI driver for one local working copy.
/// Not thread-safe: callers serialize access to the working copy.
/// Class abbreviation: gc
class GitClient : public ISourceControl {
 public:
  GitClient(common::IProcessRunner& prRunner, std::filesystem::path pathRepo,
            std::chrono::seconds durTimeout);
  ~GitClient() override;

  /// Clone sRemoteUrl into the repository path unless it already holds a repo.
  void ensureCloned(const std::string& sRemoteUrl);

  void checkout(const std::string& sRef) override;
  void pull() override;
  std::optional<common::CommitInfo> findCommitBeforeWeeklyCutoff(
      std::chrono::system_clock::time_point tpNow) override;
  void addWorktree(const std::string& sCommit, const std::filesystem::path& pathDir) override;
  void removeWorktree(const std::filesystem::path& pathDir) override;

  /// Monday of the ISO week containing tpNow, in local time, as YYYY-MM-DD.
  static std::string weeklyCutoffDate(std::chrono::system_clock::time_point tpNow);

  /// Unix seconds of 00:00:00 local time on that Monday.
  static int64_t weeklyCutoffEpoch(std::chrono::system_clock::time_point tpNow);

  /// Parse "<hash>:<unix seconds>" as printed by --format=%H:%ct.
  /// Returns nullopt for empty output; throws SourceControlError when garbled.
  static std::optional<common::CommitInfo> parseLogLine(const std::string& sOutput);

 private:
  /// Run git with vArgs inside the repository; returns stdout or throws.
  std::string git(const std::vector<std::string>& vArgs, const std::string& sErrorCode);

  common::IProcessRunner& _prRunner;
  std::filesystem::path _pathRepo;
  std::chrono::seconds _durTimeout;
};

}  // namespace sbu::scm

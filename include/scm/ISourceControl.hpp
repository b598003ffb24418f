#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace sbu::scm {

/// Operations on the tracked repository working copy.
/// All failures throw SourceControlError.
class ISourceControl {
 public:
  virtual ~ISourceControl() = default;

  virtual void checkout(const std::string& sRef) = 0;
  virtual void pull() = 0;

  /// Most recent commit on the checked-out branch strictly before the Monday
  /// (local time) of the week containing tpNow. nullopt when none exists.
  virtual std::optional<common::CommitInfo> findCommitBeforeWeeklyCutoff(
      std::chrono::system_clock::time_point tpNow) = 0;

  /// Detached checkout of sCommit at pathDir, sharing the object database.
  virtual void addWorktree(const std::string& sCommit, const std::filesystem::path& pathDir) = 0;
  virtual void removeWorktree(const std::filesystem::path& pathDir) = 0;
};

}  // namespace sbu::scm

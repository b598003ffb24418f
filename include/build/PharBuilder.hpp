#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "build/IArtifactBuilder.hpp"

namespace sbu::common {
class IProcessRunner;
}

namespace sbu::scm {
class ISourceControl;
}

namespace sbu::build {

/// Build invocation settings.
/// Class abbreviation: bs
struct BuildSettings {
  /// Command run inside the checkout; "--build-dir=<out>" is appended.
  /// A relative first argument containing '/' is resolved against the checkout.
  std::vector<std::string> vBuildCommand = {"bin/svn-buddy", "dev:phar-create"};
  /// Optional step run before the build (e.g. composer install). Empty = skip.
  std::vector<std::string> vPrepareCommand;
  /// Parent of the disposable checkouts. Empty = system temp directory.
  std::filesystem::path pathTmpDir;
  std::chrono::seconds durTimeout{900};
};

/// Builds svn-buddy.phar and its signature from a disposable worktree, so
/// the shared working copy's checked-out ref is never moved by a build.
/// Class abbreviation: pb
class PharBuilder : public IArtifactBuilder {
 public:
  PharBuilder(scm::ISourceControl& scmRepo, common::IProcessRunner& prRunner,
              BuildSettings bsSettings);
  ~PharBuilder() override;

  BuiltArtifacts build(const std::string& sCommitHash,
                       const std::filesystem::path& pathOutputDir) override;

 private:
  void runStep(const std::string& sStep, std::vector<std::string> vArgs,
               const std::filesystem::path& pathCheckout);

  scm::ISourceControl& _scmRepo;
  common::IProcessRunner& _prRunner;
  BuildSettings _bsSettings;
};

}  // namespace sbu::build

#include "build/PharBuilder.hpp"

#include "common/Artifacts.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/ProcessRunner.hpp"
#include "common/ScopedDirectory.hpp"
#include "scm/ISourceControl.hpp"

#include <optional>
#include <stdexcept>
#include <system_error>

namespace sbu::build {

namespace {

/// Registers a worktree and unregisters it on scope exit.
class ScopedWorktree {
 public:
  ScopedWorktree(scm::ISourceControl& scmRepo, const std::string& sCommit,
                 std::filesystem::path pathDir)
      : _scmRepo(scmRepo), _pathDir(std::move(pathDir)) {
    _scmRepo.addWorktree(sCommit, _pathDir);
  }

  ~ScopedWorktree() {
    try {
      _scmRepo.removeWorktree(_pathDir);
    } catch (const common::SourceControlError& ex) {
      // The directory itself is still removed by its ScopedDirectory
      common::Logger::get()->warn("Failed to unregister worktree {}: {}", _pathDir.string(),
                                  ex.what());
    }
  }

  ScopedWorktree(const ScopedWorktree&) = delete;
  ScopedWorktree& operator=(const ScopedWorktree&) = delete;

 private:
  scm::ISourceControl& _scmRepo;
  std::filesystem::path _pathDir;
};

}  // anonymous namespace

PharBuilder::PharBuilder(scm::ISourceControl& scmRepo, common::IProcessRunner& prRunner,
                         BuildSettings bsSettings)
    : _scmRepo(scmRepo), _prRunner(prRunner), _bsSettings(std::move(bsSettings)) {
  if (_bsSettings.vBuildCommand.empty()) {
    throw std::invalid_argument("PharBuilder: build command must not be empty");
  }
  if (_bsSettings.pathTmpDir.empty()) {
    _bsSettings.pathTmpDir = std::filesystem::temp_directory_path();
  }
}

PharBuilder::~PharBuilder() = default;

void PharBuilder::runStep(const std::string& sStep, std::vector<std::string> vArgs,
                          const std::filesystem::path& pathCheckout) {
  const std::filesystem::path pathProgram(vArgs.front());
  if (pathProgram.is_relative() && vArgs.front().find('/') != std::string::npos) {
    vArgs.front() = (pathCheckout / pathProgram).string();
  }

  common::ProcessSpec psSpec;
  psSpec.vArgs = std::move(vArgs);
  psSpec.sWorkingDir = pathCheckout.string();
  psSpec.durTimeout = _bsSettings.durTimeout;

  common::ProcessResult pres;
  try {
    pres = _prRunner.run(psSpec);
  } catch (const std::system_error& ex) {
    throw common::BuildError("build_failed", sStep + ": cannot start " +
                                                 common::describeCommand(psSpec.vArgs) + ": " +
                                                 ex.what());
  }

  if (pres.bTimedOut) {
    throw common::BuildError("build_timeout", sStep + " timed out after " +
                                                  std::to_string(_bsSettings.durTimeout.count()) +
                                                  "s");
  }
  if (pres.iExitCode != 0) {
    throw common::BuildError("build_failed", sStep + " exited with " +
                                                 std::to_string(pres.iExitCode) + ": " +
                                                 pres.sStderr);
  }
}

BuiltArtifacts PharBuilder::build(const std::string& sCommitHash,
                                  const std::filesystem::path& pathOutputDir) {
  auto spLog = common::Logger::get();
  spLog->info("Building snapshot {} into {}", sCommitHash, pathOutputDir.string());

  std::error_code ec;
  std::filesystem::create_directories(pathOutputDir, ec);
  if (ec) {
    throw common::BuildError("build_failed",
                             "Cannot create " + pathOutputDir.string() + ": " + ec.message());
  }

  std::optional<common::ScopedDirectory> osdTmp;
  try {
    osdTmp.emplace(common::ScopedDirectory::createUnique(_bsSettings.pathTmpDir, "sbu-build-"));
  } catch (const std::system_error& ex) {
    throw common::BuildError("build_failed",
                             std::string("Cannot create build directory: ") + ex.what());
  }

  const auto pathCheckout = osdTmp->path() / "checkout";
  {
    ScopedWorktree swTree(_scmRepo, sCommitHash, pathCheckout);

    if (!_bsSettings.vPrepareCommand.empty()) {
      runStep("prepare", _bsSettings.vPrepareCommand, pathCheckout);
    }

    auto vBuild = _bsSettings.vBuildCommand;
    vBuild.push_back("--build-dir=" + pathOutputDir.string());
    runStep("build", std::move(vBuild), pathCheckout);
  }

  BuiltArtifacts ba{
      pathOutputDir / common::artifactFileName(common::ArtifactKind::Binary),
      pathOutputDir / common::artifactFileName(common::ArtifactKind::Signature),
  };
  for (const auto& pathFile : {ba.pathBinary, ba.pathSignature}) {
    if (!std::filesystem::is_regular_file(pathFile)) {
      throw common::BuildError("artifact_missing",
                               "Build did not produce " + pathFile.string());
    }
  }

  spLog->info("Snapshot {} built", sCommitHash);
  return ba;
}

}  // namespace sbu::build

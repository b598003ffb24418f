#pragma once

#include <filesystem>
#include <string>

namespace sbu::build {

/// Local files produced by one snapshot build.
/// Class abbreviation: ba
struct BuiltArtifacts {
  std::filesystem::path pathBinary;
  std::filesystem::path pathSignature;
};

/// Produces release artifacts for a commit.
class IArtifactBuilder {
 public:
  virtual ~IArtifactBuilder() = default;

  /// Build sCommitHash into pathOutputDir. Throws BuildError when the build
  /// fails or an expected artifact is missing.
  virtual BuiltArtifacts build(const std::string& sCommitHash,
                               const std::filesystem::path& pathOutputDir) = 0;
};

}  // namespace sbu::build

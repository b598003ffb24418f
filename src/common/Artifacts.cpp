#include "common/Artifacts.hpp"

#include "common/Errors.hpp"

namespace sbu::common {

std::string artifactFileName(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::Binary:
      return "svn-buddy.phar";
    case ArtifactKind::Signature:
      return "svn-buddy.phar.sig";
  }
  throw std::logic_error("unhandled ArtifactKind");
}

std::string artifactColumn(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::Binary:
      return "phar_artifact_url";
    case ArtifactKind::Signature:
      return "signature_artifact_url";
  }
  throw std::logic_error("unhandled ArtifactKind");
}

std::optional<ArtifactKind> artifactKindFromFileName(const std::string& sFileName) {
  for (const auto kind : kAllArtifactKinds) {
    if (artifactFileName(kind) == sFileName) {
      return kind;
    }
  }
  return std::nullopt;
}

void setArtifactUrl(Release& rel, ArtifactKind kind, const std::string& sUrl) {
  if (kind == ArtifactKind::Binary) {
    rel.sPharUrl = sUrl;
  } else {
    rel.sSignatureUrl = sUrl;
  }
}

const std::string& artifactUrl(const Release& rel, ArtifactKind kind) {
  return kind == ArtifactKind::Binary ? rel.sPharUrl : rel.sSignatureUrl;
}

std::string stabilityToString(Stability stability) {
  return stability == Stability::Stable ? "stable" : "snapshot";
}

Stability stabilityFromString(const std::string& sValue) {
  if (sValue == "stable") return Stability::Stable;
  if (sValue == "snapshot") return Stability::Snapshot;
  throw ValidationError("invalid_stability", "Unknown stability value: '" + sValue + "'");
}

}  // namespace sbu::common

#pragma once

#include <array>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace sbu::common {

/// Every artifact kind, in upload order.
inline constexpr std::array<ArtifactKind, 2> kAllArtifactKinds = {
    ArtifactKind::Binary, ArtifactKind::Signature};

/// Asset / object file name of an artifact ("svn-buddy.phar", "svn-buddy.phar.sig").
std::string artifactFileName(ArtifactKind kind);

/// Catalog column holding the artifact URL.
std::string artifactColumn(ArtifactKind kind);

/// Reverse of artifactFileName(). Returns nullopt for unrecognized names.
std::optional<ArtifactKind> artifactKindFromFileName(const std::string& sFileName);

/// Store sUrl in the slot of rel that corresponds to kind.
void setArtifactUrl(Release& rel, ArtifactKind kind, const std::string& sUrl);

/// Read the slot of rel that corresponds to kind.
const std::string& artifactUrl(const Release& rel, ArtifactKind kind);

std::string stabilityToString(Stability stability);

/// Throws ValidationError for anything other than "stable" or "snapshot".
Stability stabilityFromString(const std::string& sValue);

}  // namespace sbu::common

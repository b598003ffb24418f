#include "common/Artifacts.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace sbu::common;

TEST(ArtifactsTest, FileNamesAndColumns) {
  EXPECT_EQ(artifactFileName(ArtifactKind::Binary), "svn-buddy.phar");
  EXPECT_EQ(artifactFileName(ArtifactKind::Signature), "svn-buddy.phar.sig");
  EXPECT_EQ(artifactColumn(ArtifactKind::Binary), "phar_artifact_url");
  EXPECT_EQ(artifactColumn(ArtifactKind::Signature), "signature_artifact_url");
}

TEST(ArtifactsTest, KindFromFileName) {
  EXPECT_EQ(artifactKindFromFileName("svn-buddy.phar"), ArtifactKind::Binary);
  EXPECT_EQ(artifactKindFromFileName("svn-buddy.phar.sig"), ArtifactKind::Signature);
  EXPECT_FALSE(artifactKindFromFileName("other.txt").has_value());
  EXPECT_FALSE(artifactKindFromFileName("").has_value());
  EXPECT_FALSE(artifactKindFromFileName("SVN-BUDDY.PHAR").has_value());
}

TEST(ArtifactsTest, UrlSlots) {
  Release rel;
  setArtifactUrl(rel, ArtifactKind::Binary, "https://x/a.phar");
  setArtifactUrl(rel, ArtifactKind::Signature, "https://x/a.phar.sig");
  EXPECT_EQ(rel.sPharUrl, "https://x/a.phar");
  EXPECT_EQ(rel.sSignatureUrl, "https://x/a.phar.sig");
  EXPECT_EQ(artifactUrl(rel, ArtifactKind::Signature), "https://x/a.phar.sig");
}

TEST(ArtifactsTest, StabilityStrings) {
  EXPECT_EQ(stabilityToString(Stability::Stable), "stable");
  EXPECT_EQ(stabilityToString(Stability::Snapshot), "snapshot");
  EXPECT_EQ(stabilityFromString("snapshot"), Stability::Snapshot);
  EXPECT_THROW(stabilityFromString("beta"), ValidationError);
}

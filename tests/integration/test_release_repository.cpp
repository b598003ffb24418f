#include "dal/ReleaseRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

using namespace sbu;
using common::Release;
using common::Stability;
using dal::ConnectionPool;
using dal::ReleaseRepository;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("SBU_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

Release makeRelease(const std::string& sName, int64_t iDate, Stability stability) {
  return Release{sName, iDate, "https://cdn/" + sName + "/svn-buddy.phar",
                 "https://cdn/" + sName + "/svn-buddy.phar.sig", stability};
}

}  // namespace

class ReleaseRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "SBU_DB_URL not set, skipping integration test";
    }
    common::Logger::init("warn");
    _cpPool = std::make_unique<ConnectionPool>(_sDbUrl, 2);
    _rrRepo = std::make_unique<ReleaseRepository>(*_cpPool);
    _rrRepo->ensureSchema();

    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM releases");
    txn.commit();
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<ReleaseRepository> _rrRepo;
};

TEST_F(ReleaseRepositoryTest, EnsureSchemaIsIdempotent) {
  _rrRepo->ensureSchema();
  SUCCEED();
}

TEST_F(ReleaseRepositoryTest, ReplaceStableKeepsSnapshots) {
  _rrRepo->insertSnapshot(makeRelease("abc123", 3000, Stability::Snapshot));
  _rrRepo->replaceStableReleases({makeRelease("v1.0.0", 1000, Stability::Stable)});
  _rrRepo->replaceStableReleases({makeRelease("v1.1.0", 2000, Stability::Stable),
                                  makeRelease("v1.2.0", 2500, Stability::Stable)});

  EXPECT_EQ(_rrRepo->downloadUrl("v1.0.0", common::ArtifactKind::Binary), "");
  EXPECT_EQ(_rrRepo->downloadUrl("v1.2.0", common::ArtifactKind::Signature),
            "https://cdn/v1.2.0/svn-buddy.phar.sig");
  EXPECT_TRUE(_rrRepo->findSnapshotByVersion("abc123").has_value());
}

TEST_F(ReleaseRepositoryTest, FailedReplaceRollsBack) {
  _rrRepo->replaceStableReleases({makeRelease("v1.0.0", 1000, Stability::Stable)});

  EXPECT_THROW(_rrRepo->replaceStableReleases({makeRelease("v2.0.0", 2000, Stability::Stable),
                                               makeRelease("v2.0.0", 2001, Stability::Stable)}),
               common::DuplicateVersionError);

  EXPECT_EQ(_rrRepo->downloadUrl("v1.0.0", common::ArtifactKind::Binary),
            "https://cdn/v1.0.0/svn-buddy.phar");
  EXPECT_EQ(_rrRepo->downloadUrl("v2.0.0", common::ArtifactKind::Binary), "");
}

TEST_F(ReleaseRepositoryTest, InsertSnapshotRejectsDuplicate) {
  _rrRepo->insertSnapshot(makeRelease("abc123", 3000, Stability::Snapshot));
  EXPECT_THROW(_rrRepo->insertSnapshot(makeRelease("abc123", 3000, Stability::Snapshot)),
               common::DuplicateVersionError);
}

TEST_F(ReleaseRepositoryTest, FindSnapshotIgnoresStableRows) {
  _rrRepo->replaceStableReleases({makeRelease("v1.0.0", 1000, Stability::Stable)});
  EXPECT_FALSE(_rrRepo->findSnapshotByVersion("v1.0.0").has_value());

  _rrRepo->insertSnapshot(makeRelease("abc123", 3000, Stability::Snapshot));
  const auto oRel = _rrRepo->findSnapshotByVersion("abc123");
  ASSERT_TRUE(oRel.has_value());
  EXPECT_EQ(oRel->iReleaseDate, 3000);
  EXPECT_EQ(oRel->stability, Stability::Snapshot);
}

TEST_F(ReleaseRepositoryTest, LatestPerStabilityBreaksTiesByVersionName) {
  _rrRepo->replaceStableReleases({makeRelease("v1.0.0", 1000, Stability::Stable),
                                  makeRelease("v1.1.0", 2000, Stability::Stable)});
  _rrRepo->insertSnapshot(makeRelease("aaa", 5000, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("bbb", 5000, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("000", 4000, Stability::Snapshot));

  const auto mapLatest = _rrRepo->latestPerStability();
  ASSERT_EQ(mapLatest.size(), 2u);
  EXPECT_EQ(mapLatest.at(Stability::Stable).sVersionName, "v1.1.0");
  EXPECT_EQ(mapLatest.at(Stability::Snapshot).sVersionName, "bbb");
}

TEST_F(ReleaseRepositoryTest, LatestOnEmptyCatalog) {
  EXPECT_TRUE(_rrRepo->latestPerStability().empty());
}

TEST_F(ReleaseRepositoryTest, SnapshotsOlderThanOrdersOldestFirst) {
  _rrRepo->insertSnapshot(makeRelease("ccc", 300, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("aaa", 100, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("bbb", 200, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("ddd", 900, Stability::Snapshot));
  _rrRepo->replaceStableReleases({makeRelease("v0.1.0", 50, Stability::Stable)});

  EXPECT_EQ(_rrRepo->snapshotsOlderThan(500, "ccc"),
            (std::vector<std::string>{"aaa", "bbb"}));
  EXPECT_EQ(_rrRepo->snapshotsOlderThan(200, ""), (std::vector<std::string>{"aaa"}));
}

TEST_F(ReleaseRepositoryTest, DeleteVersionsCountsRows) {
  _rrRepo->insertSnapshot(makeRelease("aaa", 100, Stability::Snapshot));
  _rrRepo->insertSnapshot(makeRelease("bbb", 200, Stability::Snapshot));

  EXPECT_EQ(_rrRepo->deleteVersions({"aaa", "bbb", "missing"}), 2);
  EXPECT_EQ(_rrRepo->deleteVersions({}), 0);
  EXPECT_FALSE(_rrRepo->findSnapshotByVersion("aaa").has_value());
}

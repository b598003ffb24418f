#include "api/routes/ReleaseRoutes.hpp"

#include "api/routes/HealthRoutes.hpp"
#include "core/ReleaseSyncOrchestrator.hpp"
#include "fakes/Fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

using namespace sbu;
using api::routes::ReleaseRoutes;
using common::LatestVersion;
using common::Stability;

TEST(ReleaseRoutesTest, LatestJsonShape) {
  const std::map<Stability, LatestVersion> mapLatest = {
      {Stability::Stable, LatestVersion{"/download/v1.2.0/svn-buddy.phar", "v1.2.0", 50300}},
      {Stability::Snapshot, LatestVersion{"/download/abc123/svn-buddy.phar", "abc123", 50300}},
  };

  const auto j = ReleaseRoutes::latestToJson(mapLatest);
  EXPECT_EQ(j["stable"]["path"], "/download/v1.2.0/svn-buddy.phar");
  EXPECT_EQ(j["stable"]["version"], "v1.2.0");
  EXPECT_EQ(j["stable"]["min-php"], 50300);
  EXPECT_EQ(j["snapshot"]["version"], "abc123");
}

TEST(ReleaseRoutesTest, EmptyCatalogIsEmptyObject) {
  const auto j = ReleaseRoutes::latestToJson({});
  EXPECT_TRUE(j.is_object());
  EXPECT_EQ(j.dump(), "{}");
}

// ── Routes served through Crow ──────────────────────────────────────────────

class ReleaseRoutesHttpTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathSnapshots = test::makeTempDir("routes");
    core::SyncSettings ss;
    ss.pathSnapshotsDir = _pathSnapshots;
    _upRso = std::make_unique<core::ReleaseSyncOrchestrator>(_catalog, _source, _scm, _builder,
                                                             _store, ss);
    _upRoutes = std::make_unique<ReleaseRoutes>(*_upRso);
    _upRoutes->registerRoutes(_app);
    _hrHealth.registerRoutes(_app);
    _app.validate();
  }

  void TearDown() override { std::filesystem::remove_all(_pathSnapshots); }

  crow::response get(const std::string& sUrl) {
    crow::request req;
    req.method = crow::HTTPMethod::GET;
    req.url = sUrl;
    req.raw_url = sUrl;
    crow::response res;
    _app.handle_full(req, res);
    return res;
  }

  std::filesystem::path _pathSnapshots;
  test::FakeCatalog _catalog;
  test::FakeReleaseSource _source;
  test::FakeSourceControl _scm;
  test::FakeBuilder _builder;
  test::FakeArtifactStore _store;
  std::unique_ptr<core::ReleaseSyncOrchestrator> _upRso;
  std::unique_ptr<ReleaseRoutes> _upRoutes;
  api::routes::HealthRoutes _hrHealth;
  crow::SimpleApp _app;
};

TEST_F(ReleaseRoutesHttpTest, HealthReportsOk) {
  const auto res = get("/health");
  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "ok");
}

TEST_F(ReleaseRoutesHttpTest, LatestListsNewestPerStability) {
  _catalog.put("v1.1.0", 1000, Stability::Stable);
  _catalog.put("v1.2.0", 2000, Stability::Stable);
  _catalog.put("abc123", 3000, Stability::Snapshot);

  const auto res = get("/api/latest");
  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");

  const auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["stable"]["version"], "v1.2.0");
  EXPECT_EQ(j["stable"]["path"], "/download/v1.2.0/svn-buddy.phar");
  EXPECT_EQ(j["snapshot"]["version"], "abc123");
  EXPECT_EQ(j["snapshot"]["min-php"], 50300);
}

TEST_F(ReleaseRoutesHttpTest, LatestOnEmptyCatalogIsEmptyObject) {
  const auto res = get("/api/latest");
  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(res.body, "{}");
}

TEST_F(ReleaseRoutesHttpTest, LatestCatalogFailureIs500) {
  _catalog.bFailReads = true;
  const auto res = get("/api/latest");
  EXPECT_EQ(res.code, 500);
  EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "internal_error");
}

TEST_F(ReleaseRoutesHttpTest, DownloadRedirectsToArtifact) {
  _catalog.put("v1.2.0", 1000, Stability::Stable);

  auto res = get("/download/v1.2.0/svn-buddy.phar");
  EXPECT_EQ(res.code, 302);
  EXPECT_EQ(res.get_header_value("Location"), "https://cdn/v1.2.0/svn-buddy.phar");

  res = get("/download/v1.2.0/svn-buddy.phar.sig");
  EXPECT_EQ(res.code, 302);
  EXPECT_EQ(res.get_header_value("Location"), "https://cdn/v1.2.0/svn-buddy.phar.sig");
}

TEST_F(ReleaseRoutesHttpTest, DownloadUnknownFileIs404) {
  _catalog.put("v1.2.0", 1000, Stability::Stable);

  const auto res = get("/download/v1.2.0/CHANGELOG.md");
  EXPECT_EQ(res.code, 404);
  EXPECT_EQ(res.get_header_value("Location"), "");
  const auto j = nlohmann::json::parse(res.body);
  EXPECT_EQ(j["error"], "artifact_not_found");
}

TEST_F(ReleaseRoutesHttpTest, DownloadUnknownVersionIs404) {
  const auto res = get("/download/v9.9.9/svn-buddy.phar");
  EXPECT_EQ(res.code, 404);
  EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "artifact_not_found");
}

TEST_F(ReleaseRoutesHttpTest, DownloadCatalogFailureIs500) {
  _catalog.bFailReads = true;
  const auto res = get("/download/v1.2.0/svn-buddy.phar");
  EXPECT_EQ(res.code, 500);
  EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "internal_error");
}

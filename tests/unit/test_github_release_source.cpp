#include "upstream/GitHubReleaseSource.hpp"

#include "common/Errors.hpp"
#include "fakes/Fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace sbu;
using test::FakeHttpClient;
using upstream::GitHubReleaseSource;

namespace {

const std::string kPage1 = R"([
  {"name": "v1.2.0", "tag_name": "v1.2.0", "published_at": "2019-01-10T00:00:00Z",
   "assets": [
     {"name": "svn-buddy.phar",
      "browser_download_url": "https://github.com/console-helpers/svn-buddy/releases/download/v1.2.0/svn-buddy.phar"},
     {"name": "svn-buddy.phar.sig",
      "browser_download_url": "https://github.com/console-helpers/svn-buddy/releases/download/v1.2.0/svn-buddy.phar.sig"}
   ]},
  {"name": null, "tag_name": "v1.3.0-draft", "published_at": null, "assets": []}
])";

const std::string kPage2 = R"([
  {"name": "", "tag_name": "v1.1.0", "published_at": "2018-11-02T10:20:30Z", "assets": []}
])";

constexpr const char* kListUrl =
    "https://api.github.com/repos/console-helpers/svn-buddy/releases?per_page=100";

}  // namespace

class GitHubReleaseSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _gs.sCacheDir = test::makeTempDir("github").string();
    _gs.oToken = "ghp_example";
  }
  void TearDown() override { std::filesystem::remove_all(_gs.sCacheDir); }

  upstream::GitHubSettings _gs;
  FakeHttpClient _http;
};

TEST_F(GitHubReleaseSourceTest, FetchesAllPagesAndSkipsDrafts) {
  _http.dqResponses.push_back(FakeHttpClient::response(
      200, kPage1,
      {{"link", "<" + std::string(kListUrl) + "&page=2>; rel=\"next\", <" + kListUrl +
                    "&page=2>; rel=\"last\""}}));
  _http.dqResponses.push_back(FakeHttpClient::response(200, kPage2));
  GitHubReleaseSource grs(_http, _gs);

  const auto vReleases = grs.fetchReleases("console-helpers", "svn-buddy");
  ASSERT_EQ(vReleases.size(), 2u);
  EXPECT_EQ(vReleases[0].sName, "v1.2.0");
  EXPECT_EQ(vReleases[0].iPublishedAt, 1547078400);
  ASSERT_EQ(vReleases[0].vAssets.size(), 2u);
  EXPECT_EQ(vReleases[0].vAssets[1].sName, "svn-buddy.phar.sig");
  EXPECT_EQ(vReleases[1].sName, "v1.1.0");

  ASSERT_EQ(_http.vRequests.size(), 2u);
  EXPECT_EQ(_http.vRequests[0].sUrl, kListUrl);
  EXPECT_EQ(_http.vRequests[1].sUrl, std::string(kListUrl) + "&page=2");
  EXPECT_EQ(_http.vRequests[0].mapHeaders.at("Authorization"), "Bearer ghp_example");
  EXPECT_EQ(_http.vRequests[0].mapHeaders.at("Accept"), "application/vnd.github+json");
}

TEST_F(GitHubReleaseSourceTest, NotModifiedServedFromCache) {
  _http.dqResponses.push_back(FakeHttpClient::response(200, kPage2, {{"etag", "\"v1\""}}));
  _http.dqResponses.push_back(FakeHttpClient::response(304, ""));
  GitHubReleaseSource grs(_http, _gs);

  grs.fetchReleases("console-helpers", "svn-buddy");
  const auto vReleases = grs.fetchReleases("console-helpers", "svn-buddy");

  ASSERT_EQ(vReleases.size(), 1u);
  EXPECT_EQ(vReleases[0].sName, "v1.1.0");
  ASSERT_EQ(_http.vRequests.size(), 2u);
  EXPECT_EQ(_http.vRequests[0].mapHeaders.count("If-None-Match"), 0u);
  EXPECT_EQ(_http.vRequests[1].mapHeaders.at("If-None-Match"), "\"v1\"");
}

TEST_F(GitHubReleaseSourceTest, RateLimitIsReported) {
  _http.dqResponses.push_back(FakeHttpClient::response(
      403, "{\"message\":\"API rate limit exceeded\"}",
      {{"x-ratelimit-remaining", "0"}, {"x-ratelimit-reset", "1547078400"}}));
  GitHubReleaseSource grs(_http, _gs);

  try {
    grs.fetchReleases("console-helpers", "svn-buddy");
    FAIL() << "expected UpstreamFetchError";
  } catch (const common::UpstreamFetchError& ex) {
    EXPECT_EQ(ex._sErrorCode, "rate_limited");
  }
}

TEST_F(GitHubReleaseSourceTest, AuthFailureIsReported) {
  _http.dqResponses.push_back(FakeHttpClient::response(401, "{\"message\":\"Bad credentials\"}"));
  GitHubReleaseSource grs(_http, _gs);

  try {
    grs.fetchReleases("console-helpers", "svn-buddy");
    FAIL() << "expected UpstreamFetchError";
  } catch (const common::UpstreamFetchError& ex) {
    EXPECT_EQ(ex._sErrorCode, "upstream_rejected");
  }
}

TEST_F(GitHubReleaseSourceTest, ServerErrorAndTransportFailure) {
  _http.dqResponses.push_back(FakeHttpClient::response(502, "Bad Gateway"));
  GitHubReleaseSource grs(_http, _gs);
  EXPECT_THROW(grs.fetchReleases("console-helpers", "svn-buddy"), common::UpstreamFetchError);

  _http.bTransportFailure = true;
  try {
    grs.fetchReleases("console-helpers", "svn-buddy");
    FAIL() << "expected UpstreamFetchError";
  } catch (const common::UpstreamFetchError& ex) {
    EXPECT_EQ(ex._sErrorCode, "upstream_unreachable");
  }
}

TEST(GitHubReleaseSourceStaticTest, MalformedBodiesRejected) {
  EXPECT_THROW(GitHubReleaseSource::parseReleases("{\"message\":\"x\"}"),
               common::UpstreamFetchError);
  EXPECT_THROW(GitHubReleaseSource::parseReleases("not json"), common::UpstreamFetchError);
  EXPECT_THROW(GitHubReleaseSource::parseReleases("[{\"published_at\":\"2019-01-10T00:00:00Z\"}]"),
               common::UpstreamFetchError);
  EXPECT_TRUE(GitHubReleaseSource::parseReleases("[]").empty());
}

TEST(GitHubReleaseSourceStaticTest, ParseTimestamp) {
  EXPECT_EQ(GitHubReleaseSource::parseTimestamp("2019-01-10T00:00:00Z"), 1547078400);
  EXPECT_EQ(GitHubReleaseSource::parseTimestamp("2019-01-10T00:00:00.123Z"), 1547078400);
  EXPECT_EQ(GitHubReleaseSource::parseTimestamp("2019-01-10T00:00:01+00:00"), 1547078401);
  EXPECT_THROW(GitHubReleaseSource::parseTimestamp("yesterday"), common::UpstreamFetchError);
  EXPECT_THROW(GitHubReleaseSource::parseTimestamp("2019-01-10T00:00:00+02:00"),
               common::UpstreamFetchError);
}

TEST(GitHubReleaseSourceStaticTest, NextPageUrl) {
  EXPECT_EQ(GitHubReleaseSource::nextPageUrl(
                "<https://api.github.com/x?page=1>; rel=\"prev\", "
                "<https://api.github.com/x?page=3>; rel=\"next\""),
            "https://api.github.com/x?page=3");
  EXPECT_FALSE(GitHubReleaseSource::nextPageUrl("").has_value());
  EXPECT_FALSE(
      GitHubReleaseSource::nextPageUrl("<https://api.github.com/x?page=1>; rel=\"first\"")
          .has_value());
}

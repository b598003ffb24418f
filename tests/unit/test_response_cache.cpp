#include "upstream/ResponseCache.hpp"

#include "fakes/Fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using sbu::upstream::CacheEntry;
using sbu::upstream::ResponseCache;

class ResponseCacheTest : public ::testing::Test {
 protected:
  void SetUp() override { _pathDir = sbu::test::makeTempDir("cache"); }
  void TearDown() override { std::filesystem::remove_all(_pathDir); }

  std::filesystem::path _pathDir;
};

TEST_F(ResponseCacheTest, MissOnEmptyCache) {
  ResponseCache rc(_pathDir);
  EXPECT_FALSE(rc.load("https://api.github.com/repos/a/b/releases").has_value());
}

TEST_F(ResponseCacheTest, StoreThenLoad) {
  ResponseCache rc(_pathDir / "nested");
  const std::string sUrl = "https://api.github.com/repos/a/b/releases?per_page=100";
  rc.store(sUrl, CacheEntry{"W/\"abc\"", "[{\"name\":\"v1.0.0\"}]"});

  const auto oEntry = rc.load(sUrl);
  ASSERT_TRUE(oEntry.has_value());
  EXPECT_EQ(oEntry->sEtag, "W/\"abc\"");
  EXPECT_EQ(oEntry->sBody, "[{\"name\":\"v1.0.0\"}]");

  EXPECT_FALSE(rc.load(sUrl + "&page=2").has_value());
}

TEST_F(ResponseCacheTest, StoreOverwritesEntry) {
  ResponseCache rc(_pathDir);
  rc.store("u", CacheEntry{"\"1\"", "one"});
  rc.store("u", CacheEntry{"\"2\"", "two"});
  EXPECT_EQ(rc.load("u")->sBody, "two");
}

TEST_F(ResponseCacheTest, CorruptEntryIsMiss) {
  ResponseCache rc(_pathDir);
  rc.store("u", CacheEntry{"\"1\"", "one"});
  for (const auto& entry : std::filesystem::directory_iterator(_pathDir)) {
    std::ofstream(entry.path(), std::ios::trunc) << "{not json";
  }
  EXPECT_FALSE(rc.load("u").has_value());
}

TEST_F(ResponseCacheTest, UnwritableDirectoryIsTolerated) {
  const auto pathFile = _pathDir / "file";
  std::ofstream(pathFile) << "x";
  ResponseCache rc(pathFile / "sub");
  rc.store("u", CacheEntry{"\"1\"", "one"});
  EXPECT_FALSE(rc.load("u").has_value());
}

#include "dal/ReleaseRepository.hpp"

#include "common/Artifacts.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace sbu::dal {

namespace {

constexpr const char* kInsertSql =
    "INSERT INTO releases "
    "(version_name, release_date, phar_artifact_url, signature_artifact_url, stability) "
    "VALUES ($1, $2, $3, $4, $5)";

common::Release mapRow(const pqxx::row& row) {
  return common::Release{
      row[0].as<std::string>(),
      row[1].as<int64_t>(),
      row[2].as<std::string>(),
      row[3].as<std::string>(),
      common::stabilityFromString(row[4].as<std::string>()),
  };
}

void insertRow(pqxx::work& txn, const common::Release& rel) {
  txn.exec(kInsertSql,
           pqxx::params{rel.sVersionName, rel.iReleaseDate, rel.sPharUrl, rel.sSignatureUrl,
                        common::stabilityToString(rel.stability)});
}

}  // anonymous namespace

ReleaseRepository::ReleaseRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
ReleaseRepository::~ReleaseRepository() = default;

void ReleaseRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS releases ("
      "  version_name TEXT PRIMARY KEY,"
      "  release_date BIGINT NOT NULL,"
      "  phar_artifact_url TEXT NOT NULL DEFAULT '',"
      "  signature_artifact_url TEXT NOT NULL DEFAULT '',"
      "  stability TEXT NOT NULL CHECK (stability IN ('stable', 'snapshot')))");
  txn.exec(
      "CREATE INDEX IF NOT EXISTS releases_stability_date_idx "
      "ON releases (stability, release_date DESC, version_name DESC)");
  txn.commit();
}

void ReleaseRepository::replaceStableReleases(const std::vector<common::Release>& vReleases) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("DELETE FROM releases WHERE stability = 'stable'");
  const auto iRemoved = result.affected_rows();

  try {
    for (const auto& rel : vReleases) {
      insertRow(txn, rel);
    }
  } catch (const pqxx::unique_violation& ex) {
    // txn is aborted on scope exit; the old stable set stays visible
    throw common::DuplicateVersionError(
        "duplicate_version", std::string("Stable release set contains a duplicate: ") + ex.what());
  }
  txn.commit();

  common::Logger::get()->debug("Stable channel replaced: {} removed, {} inserted", iRemoved,
                               vReleases.size());
}

std::optional<common::Release> ReleaseRepository::findSnapshotByVersion(
    const std::string& sVersion) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT version_name, release_date, phar_artifact_url, signature_artifact_url, stability "
      "FROM releases WHERE version_name = $1 AND stability = 'snapshot'",
      pqxx::params{sVersion});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return mapRow(result[0]);
}

void ReleaseRepository::insertSnapshot(const common::Release& rel) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  try {
    insertRow(txn, rel);
  } catch (const pqxx::unique_violation&) {
    throw common::DuplicateVersionError(
        "duplicate_version", "Release '" + rel.sVersionName + "' already exists in the catalog");
  }
  txn.commit();
}

std::map<common::Stability, common::Release> ReleaseRepository::latestPerStability() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT DISTINCT ON (stability) "
      "version_name, release_date, phar_artifact_url, signature_artifact_url, stability "
      "FROM releases "
      "ORDER BY stability, release_date DESC, version_name DESC");
  txn.commit();

  std::map<common::Stability, common::Release> mapLatest;
  for (const auto& row : result) {
    auto rel = mapRow(row);
    mapLatest.emplace(rel.stability, std::move(rel));
  }
  return mapLatest;
}

std::vector<std::string> ReleaseRepository::snapshotsOlderThan(
    int64_t iCutoff, const std::string& sExcludingVersion) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT version_name FROM releases "
      "WHERE stability = 'snapshot' AND release_date < $1 AND version_name <> $2 "
      "ORDER BY release_date ASC, version_name ASC",
      pqxx::params{iCutoff, sExcludingVersion});
  txn.commit();

  std::vector<std::string> vVersions;
  vVersions.reserve(result.size());
  for (const auto& row : result) {
    vVersions.push_back(row[0].as<std::string>());
  }
  return vVersions;
}

int ReleaseRepository::deleteVersions(const std::vector<std::string>& vVersionNames) {
  if (vVersionNames.empty()) return 0;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  int iDeleted = 0;
  for (const auto& sVersion : vVersionNames) {
    auto result = txn.exec("DELETE FROM releases WHERE version_name = $1",
                           pqxx::params{sVersion});
    iDeleted += static_cast<int>(result.affected_rows());
  }
  txn.commit();
  return iDeleted;
}

std::string ReleaseRepository::downloadUrl(const std::string& sVersion,
                                           common::ArtifactKind kind) {
  // Column name comes from the closed ArtifactKind mapping, never from input
  const std::string sSql =
      "SELECT " + common::artifactColumn(kind) + " FROM releases WHERE version_name = $1";

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(sSql, pqxx::params{sVersion});
  txn.commit();

  if (result.empty() || result[0][0].is_null()) return "";
  return result[0][0].as<std::string>();
}

}  // namespace sbu::dal

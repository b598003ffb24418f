#include "api/routes/ReleaseRoutes.hpp"

#include "common/Artifacts.hpp"
#include "common/Logger.hpp"
#include "core/ReleaseSyncOrchestrator.hpp"

#include <string>

namespace sbu::api::routes {

namespace {

crow::response jsonResponse(int iStatus, const nlohmann::json& j) {
  crow::response res(iStatus, j.dump());
  res.set_header("Content-Type", "application/json");
  return res;
}

crow::response errorResponse(int iStatus, const std::string& sCode, const std::string& sMsg) {
  return jsonResponse(iStatus, nlohmann::json{{"error", sCode}, {"message", sMsg}});
}

}  // anonymous namespace

ReleaseRoutes::ReleaseRoutes(core::ReleaseSyncOrchestrator& rsoOrchestrator)
    : _rsoOrchestrator(rsoOrchestrator) {}

ReleaseRoutes::~ReleaseRoutes() = default;

nlohmann::json ReleaseRoutes::latestToJson(
    const std::map<common::Stability, common::LatestVersion>& mapLatest) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [stability, lv] : mapLatest) {
    j[common::stabilityToString(stability)] = {
        {"path", lv.sPath},
        {"version", lv.sVersion},
        {"min-php", lv.iMinPhpVersion},
    };
  }
  return j;
}

void ReleaseRoutes::registerRoutes(crow::SimpleApp& app) {
  CROW_ROUTE(app, "/api/latest").methods(crow::HTTPMethod::GET)([this]() {
    try {
      return jsonResponse(200, latestToJson(_rsoOrchestrator.latestVersionsForStability()));
    } catch (const std::exception& ex) {
      common::Logger::get()->error("GET /api/latest failed: {}", ex.what());
      return errorResponse(500, "internal_error", "Release catalog unavailable");
    }
  });

  CROW_ROUTE(app, "/download/<string>/<string>")
      .methods(crow::HTTPMethod::GET)([this](const std::string& sVersion,
                                             const std::string& sFile) {
        std::string sUrl;
        try {
          sUrl = _rsoOrchestrator.downloadUrl(sVersion, sFile);
        } catch (const std::exception& ex) {
          common::Logger::get()->error("GET /download/{}/{} failed: {}", sVersion, sFile,
                                       ex.what());
          return errorResponse(500, "internal_error", "Release catalog unavailable");
        }

        if (sUrl.empty()) {
          return errorResponse(404, "artifact_not_found",
                               "No artifact '" + sFile + "' for version '" + sVersion + "'");
        }

        crow::response res(302);
        res.set_header("Location", sUrl);
        return res;
      });
}

}  // namespace sbu::api::routes

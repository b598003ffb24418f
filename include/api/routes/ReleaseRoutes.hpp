#pragma once

#include <map>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace sbu::core {
class ReleaseSyncOrchestrator;
}

namespace sbu::api::routes {

/// Update-check surface consumed by svn-buddy's self-update:
///   GET /api/latest                 : newest release per stability
///   GET /download/<version>/<file>  : 302 to the artifact URL, 404 if unknown
class ReleaseRoutes {
 public:
  explicit ReleaseRoutes(core::ReleaseSyncOrchestrator& rsoOrchestrator);
  ~ReleaseRoutes();

  void registerRoutes(crow::SimpleApp& app);

  /// {"stable": {"path": ..., "version": ..., "min-php": 50300}, "snapshot": {...}}
  static nlohmann::json latestToJson(
      const std::map<common::Stability, common::LatestVersion>& mapLatest);

 private:
  core::ReleaseSyncOrchestrator& _rsoOrchestrator;
};

}  // namespace sbu::api::routes

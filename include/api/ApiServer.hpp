#pragma once

#include <memory>

#include <crow.h>

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/ReleaseRoutes.hpp"

namespace sbu::core {
class ReleaseSyncOrchestrator;
}

namespace sbu::api {

/// Owns the Crow application instance; registers all routes at construction.
/// Class abbreviation: api
class ApiServer {
 public:
  explicit ApiServer(core::ReleaseSyncOrchestrator& rsoOrchestrator);
  ~ApiServer();

  /// Blocks until stop() is called from another thread.
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::HealthRoutes _hrHealth;
  routes::ReleaseRoutes _rrReleases;
};

}  // namespace sbu::api

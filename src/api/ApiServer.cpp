#include "api/ApiServer.hpp"

#include "common/Logger.hpp"

namespace sbu::api {

ApiServer::ApiServer(core::ReleaseSyncOrchestrator& rsoOrchestrator)
    : _rrReleases(rsoOrchestrator) {
  _app.loglevel(crow::LogLevel::Warning);
  _hrHealth.registerRoutes(_app);
  _rrReleases.registerRoutes(_app);
}

ApiServer::~ApiServer() = default;

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace sbu::api

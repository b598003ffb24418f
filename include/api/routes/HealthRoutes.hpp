#pragma once

#include <crow.h>

namespace sbu::api::routes {

/// Handler for /health
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);
};

}  // namespace sbu::api::routes

#include "api/routes/HealthRoutes.hpp"

#include <nlohmann/json.hpp>

namespace sbu::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  CROW_ROUTE(app, "/health").methods(crow::HTTPMethod::GET)([]() {
    crow::response res(200, nlohmann::json{{"status", "ok"}}.dump());
    res.set_header("Content-Type", "application/json");
    return res;
  });
}

}  // namespace sbu::api::routes

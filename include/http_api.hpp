#pragma once
#include <atomic>

#include <nlohmann/json.hpp>

#include "controller.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace httplib {
class Server;
}

nlohmann::json to_json(const PredictionResult& r);
nlohmann::json to_json(const DeployResult& r);
nlohmann::json to_json(const PromoteResult& r);
nlohmann::json to_json(const HealthCheckResult& r);
nlohmann::json to_json(const DeploymentStatus& s);
nlohmann::json error_json(const CanaryError& e);

// HTTP status for a controller error.
int http_status(const CanaryError& e);

// Parses {"features":[...]}; throws InvalidInputError.
FeatureVector parse_features(const std::string& body);
// Parses {"model_path":"..."}; throws InvalidInputError.
std::string parse_model_path(const std::string& body);

void register_routes(httplib::Server& svr, CanaryController& ctl, std::atomic<bool>& ready);

#include "http_api.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <functional>

#include "util.hpp"

using nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";

// Runs op and turns controller errors into JSON error responses.
void handle(httplib::Response& res, const std::function<json()>& op) {
  try {
    res.set_content(op().dump(2), kJson);
  } catch (const CanaryError& e) {
    res.status = http_status(e);
    spdlog::warn("Request rejected ({}): {}", e.kind(), e.what());
    res.set_content(error_json(e).dump(2), kJson);
  }
}

}  // namespace

json to_json(const PredictionResult& r) {
  return {{"churn_probability", r.probability},
          {"model_used", variant_name(r.variant)},
          {"latency_ms", r.latency_ms}};
}

json to_json(const DeployResult& r) {
  return {{"status", "success"},
          {"message", "Canary model deployed successfully"},
          {"model_path", r.model_path},
          {"canary_start_time", format_iso8601(r.start_time)}};
}

json to_json(const PromoteResult& r) {
  return {{"status", "success"},
          {"message", "Canary promoted to stable successfully"},
          {"previous_stable_model", r.previous_stable_path},
          {"new_stable_model", r.new_stable_path}};
}

json to_json(const HealthCheckResult& r) {
  json j{{"alert_triggered", r.alert},
         {"message", r.message},
         {"stable_sample_count", r.stable_count},
         {"canary_sample_count", r.canary_count}};
  if (r.sufficient_data) {
    j["p_value"] = r.p_value;
    j["t_statistic"] = r.t_statistic;
    j["degrees_of_freedom"] = r.degrees_of_freedom;
    j["stable_avg_latency_ms"] = r.stable_mean_ms;
    j["canary_avg_latency_ms"] = r.canary_mean_ms;
  }
  return j;
}

json to_json(const DeploymentStatus& s) {
  json j{{"message", "Churn Prediction API"},
         {"stable_model", s.stable_path},
         {"stable_version", s.stable_version},
         {"canary_model", nullptr},
         {"canary_active", s.canary_active},
         {"simulate_slowdown", s.simulate_slowdown},
         {"stable_sample_count", s.stable_samples},
         {"canary_sample_count", s.canary_samples}};
  if (s.canary_active) {
    j["canary_model"] = s.canary_path;
    j["canary_version"] = s.canary_version;
    j["canary_start_time"] = format_iso8601(s.canary_start_time);
  }
  return j;
}

json error_json(const CanaryError& e) {
  return {{"status", "error"}, {"error", e.kind()}, {"message", e.what()}};
}

int http_status(const CanaryError& e) {
  if (dynamic_cast<const InvalidInputError*>(&e)) return 422;
  if (dynamic_cast<const InvalidStateError*>(&e)) return 409;
  if (auto* le = dynamic_cast<const ModelLoadError*>(&e)) return le->not_found() ? 404 : 400;
  return 500;
}

FeatureVector parse_features(const std::string& body) {
  json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) throw InvalidInputError("Request body is not a JSON object");
  auto it = j.find("features");
  if (it == j.end() || !it->is_array()) throw InvalidInputError("'features' must be an array");

  FeatureVector features;
  features.reserve(it->size());
  for (const auto& v : *it) {
    if (!v.is_number()) throw InvalidInputError("'features' must contain only numbers");
    features.push_back(v.get<double>());
  }
  return features;
}

std::string parse_model_path(const std::string& body) {
  json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) throw InvalidInputError("Request body is not a JSON object");
  auto it = j.find("model_path");
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty())
    throw InvalidInputError("'model_path' must be a non-empty string");
  return it->get<std::string>();
}

void register_routes(httplib::Server& svr, CanaryController& ctl, std::atomic<bool>& ready) {
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", kJson);
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}", kJson);
  });

  svr.Get("/", [&](const httplib::Request&, httplib::Response& res) {
    handle(res, [&] { return to_json(ctl.status()); });
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(ctl.latencies().prometheus_text(), "text/plain; version=0.0.4");
  });

  svr.Post("/predict", [&](const httplib::Request& req, httplib::Response& res) {
    handle(res, [&] { return to_json(ctl.predict(parse_features(req.body))); });
  });

  svr.Post("/admin/deploy-canary", [&](const httplib::Request& req, httplib::Response& res) {
    handle(res, [&] { return to_json(ctl.deploy_canary(parse_model_path(req.body))); });
  });

  svr.Post("/admin/rollback-canary", [&](const httplib::Request&, httplib::Response& res) {
    handle(res, [&] {
      ctl.rollback_canary();
      return json{{"status", "success"}, {"message", "Canary rolled back successfully"}};
    });
  });

  svr.Post("/admin/promote-canary", [&](const httplib::Request&, httplib::Response& res) {
    handle(res, [&] { return to_json(ctl.promote_canary()); });
  });

  svr.Post("/admin/toggle-slowdown", [&](const httplib::Request&, httplib::Response& res) {
    handle(res, [&] {
      const bool on = ctl.toggle_slowdown();
      return json{{"simulate_slowdown", on},
                  {"message", on ? "Slowdown simulation enabled" : "Slowdown simulation disabled"}};
    });
  });

  svr.Get("/admin/check-canary-health", [&](const httplib::Request&, httplib::Response& res) {
    handle(res, [&] { return to_json(ctl.check_canary_health()); });
  });
}

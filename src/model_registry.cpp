#include "model_registry.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cmath>
#include <filesystem>

#include "errors.hpp"

using namespace std::chrono;

LogisticModel::LogisticModel(std::vector<double> coefficients, double intercept,
                             std::string version)
    : coefficients_(std::move(coefficients)), intercept_(intercept), version_(std::move(version)) {}

double LogisticModel::predict(const FeatureVector& features) const {
  if (features.size() != coefficients_.size()) {
    throw InvalidInputError("Expected " + std::to_string(coefficients_.size()) +
                            " features, got " + std::to_string(features.size()));
  }
  double z = intercept_;
  for (size_t i = 0; i < features.size(); ++i) z += coefficients_[i] * features[i];
  // Split on sign so exp() never overflows.
  if (z >= 0.0) return 1.0 / (1.0 + std::exp(-z));
  const double e = std::exp(z);
  return e / (1.0 + e);
}

ModelHandle ModelRegistry::load(const std::string& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    spdlog::warn("Model file not found: {}", path);
    throw ModelLoadError(path, "file not found", true);
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ModelLoadError(path, "not a regular file");
  }

  spdlog::info("Loading model from {}", path);
  auto t0 = steady_clock::now();

  std::vector<double> coefficients;
  double intercept = 0.0;
  std::string version;
  try {
    const YAML::Node root = YAML::LoadFile(path);
    const YAML::Node m = root.IsMap() ? root["model"] : YAML::Node();
    if (!m || !m.IsMap()) throw ModelLoadError(path, "missing 'model' section");

    std::string type = m["type"] ? m["type"].as<std::string>("") : "";
    if (type != "logistic_regression") {
      throw ModelLoadError(path, "unsupported model type '" + type + "'");
    }

    if (!m["coefficients"] || !m["coefficients"].IsSequence())
      throw ModelLoadError(path, "missing coefficients");
    for (const auto& c : m["coefficients"]) coefficients.push_back(c.as<double>());
    if (m["intercept"]) intercept = m["intercept"].as<double>();
    version = m["version"] ? m["version"].as<std::string>("") : "";
  } catch (const YAML::Exception& e) {
    spdlog::warn("Model artifact {} is unreadable: {}", path, e.what());
    throw ModelLoadError(path, std::string("unreadable artifact: ") + e.what());
  }

  if (coefficients.empty()) throw ModelLoadError(path, "empty coefficients");
  for (double c : coefficients) {
    if (!std::isfinite(c)) throw ModelLoadError(path, "non-finite coefficient");
  }
  if (!std::isfinite(intercept)) throw ModelLoadError(path, "non-finite intercept");

  if (version.empty()) version = std::filesystem::path(path).stem().string();

  auto model = std::make_shared<const LogisticModel>(std::move(coefficients), intercept, version);

  double load_ms = duration<double, std::milli>(steady_clock::now() - t0).count();
  spdlog::info("Model {} loaded in {:.2f}ms ({} features)", version, load_ms, model->n_features());
  return model;
}

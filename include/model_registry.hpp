#pragma once

#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

// Anything that maps a feature vector to a class-1 probability.
// Instances are immutable once loaded and shared between concurrent requests.
class Model {
public:
  virtual ~Model() = default;
  virtual double predict(const FeatureVector& features) const = 0;
  virtual size_t n_features() const = 0;
  virtual std::string version() const = 0;
};

using ModelHandle = std::shared_ptr<const Model>;

// Binary logistic regression: sigmoid(intercept + coefficients . x)
class LogisticModel : public Model {
public:
  LogisticModel(std::vector<double> coefficients, double intercept, std::string version);

  double predict(const FeatureVector& features) const override;
  size_t n_features() const override { return coefficients_.size(); }
  std::string version() const override { return version_; }

  const std::vector<double>& coefficients() const { return coefficients_; }
  double intercept() const { return intercept_; }

private:
  std::vector<double> coefficients_;
  double intercept_;
  std::string version_;
};

// "Load model from path" capability. Throws ModelLoadError.
class ModelLoader {
public:
  virtual ~ModelLoader() = default;
  virtual ModelHandle load(const std::string& path) = 0;
};

// Reads YAML model artifacts from disk. Every load goes back to the file so a
// deployment always proves the artifact is currently valid.
class ModelRegistry : public ModelLoader {
public:
  ModelHandle load(const std::string& path) override;
};

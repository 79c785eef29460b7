#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "pipeline_types.hpp"

namespace dbforecast {

struct ModelOptions {
  std::filesystem::path file;   // model-specific parameter file
  int nmax = 12;
};

using ModelFactory = std::function<std::unique_ptr<InferenceModel>(const ModelOptions&)>;

// Name-keyed set of model constructors, resolved once per forecast run.
class ModelRegistry {
 public:
  // Registry preloaded with "replay" and "linear".
  static ModelRegistry withBuiltins();

  // Replaces any factory already registered under `name`.
  void add(const std::string& name, ModelFactory factory);

  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;

  // Throws std::invalid_argument for an unknown name (message lists the known ones);
  // factories throw std::runtime_error when their parameter file cannot be loaded.
  std::unique_ptr<InferenceModel> create(const std::string& name, const ModelOptions& options) const;

 private:
  std::map<std::string, ModelFactory> factories_;
};

}  // namespace dbforecast

#include "model_registry.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "models.hpp"
#include "sph_basis.hpp"

namespace dbforecast {

static std::string lower(const std::string& s) {
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return t;
}

ModelRegistry ModelRegistry::withBuiltins() {
  ModelRegistry r;

  r.add("replay", [](const ModelOptions& o) -> std::unique_ptr<InferenceModel> {
    auto m = std::make_unique<ReplayModel>(basisSize(o.nmax));
    if (!m->load(o.file.string())) {
      throw std::runtime_error("failed to load replay coefficients: " + o.file.string());
    }
    return m;
  });

  r.add("linear", [](const ModelOptions& o) -> std::unique_ptr<InferenceModel> {
    auto m = std::make_unique<LinearModel>(basisSize(o.nmax));
    if (!m->load(o.file.string())) {
      throw std::runtime_error("failed to load linear readout weights: " + o.file.string());
    }
    return m;
  });

  return r;
}

void ModelRegistry::add(const std::string& name, ModelFactory factory) {
  factories_[lower(name)] = std::move(factory);
}

bool ModelRegistry::contains(const std::string& name) const {
  return factories_.find(lower(name)) != factories_.end();
}

std::vector<std::string> ModelRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& kv : factories_) out.push_back(kv.first);
  return out;
}

std::unique_ptr<InferenceModel> ModelRegistry::create(const std::string& name,
                                                      const ModelOptions& options) const {
  auto it = factories_.find(lower(name));
  if (it == factories_.end()) {
    std::ostringstream oss;
    oss << "unknown model '" << name << "'; available:";
    for (const auto& kv : factories_) oss << " " << kv.first;
    throw std::invalid_argument(oss.str());
  }
  return it->second(options);
}

}  // namespace dbforecast

#include "compiler_registry.hpp"

#include <mutex>

#include "internal/identity/platform.hpp"
#include "internal/util/errors.hpp"

namespace resource::compile {

void CompilerRegistry::Register(std::string type, uint64_t platform, CompileFn fn) {
  if (type.empty()) throw util::InvalidState("compiler type must not be empty");
  if (!fn) throw util::InvalidState("compiler function must be set");

  std::unique_lock lock(mutex_);
  registrations_.push_back({std::move(type), platform, std::move(fn)});
}

std::vector<CompileFn> CompilerRegistry::Candidates(const std::string& type, uint64_t platform) const {
  std::vector<CompileFn> candidates;

  std::shared_lock lock(mutex_);
  for (uint64_t step : identity::ReductionChain(platform)) {
    for (const auto& registration : registrations_) {
      if (registration.type == type && registration.platform == step) candidates.push_back(registration.fn);
    }
  }
  return candidates;
}

CompileOutput CompilerRegistry::Run(const std::string& type, const CompileInput& input) const {
  const auto candidates = Candidates(type, input.platform);
  if (candidates.empty()) {
    throw util::CompileFailure("no compiler for type '" + type + "' on platform " + std::to_string(input.platform));
  }

  std::string last_error;
  for (const auto& candidate : candidates) {
    try {
      auto output = candidate(input);
      if (!output.payload) throw util::CompileFailure("compiler produced no payload");
      return output;
    } catch (const util::CompileFailure& e) {
      last_error = e.what();
    }
  }
  throw util::CompileFailure("compile of type '" + type + "' failed: " + last_error);
}

} // namespace resource::compile

#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "resource/pipeline/v1.hpp"

namespace resource::compile {

struct CompileInput {
  const resource::pipeline::v1::SourceRecord& record;
  std::shared_ptr<arrow::Buffer>              payload;
  uint64_t                                    platform = 0;
};

struct CompileOutput {
  std::shared_ptr<arrow::Buffer>               payload;
  std::vector<resource::pipeline::v1::Section> sections;
};

// Throws util::CompileFailure to reject its input.
using CompileFn = std::function<CompileOutput(const CompileInput&)>;

/*
  Transforms keyed by (resource type, platform tag).

  Lookup walks the reduction chain of the requested platform down to 0,
  so a transform registered for platform 0 serves every platform and a
  more specific registration wins over a generic one. Within one chain
  step transforms are tried in registration order until one succeeds.
*/
class CompilerRegistry {
 public:
  void Register(std::string type, uint64_t platform, CompileFn fn);

  std::vector<CompileFn> Candidates(const std::string& type, uint64_t platform) const;

  // Throws util::CompileFailure when no candidate exists or all fail.
  CompileOutput Run(const std::string& type, const CompileInput& input) const;

 private:
  struct Registration {
    std::string type;
    uint64_t    platform;
    CompileFn   fn;
  };

  mutable std::shared_mutex mutex_;
  std::vector<Registration> registrations_;
};

using CompilerRegistryPtr = std::shared_ptr<CompilerRegistry>;

// "blob": payload as the static section.
// "properties": payload as static, JSON property map as dynamic.
void RegisterBuiltinCompilers(CompilerRegistry& registry);

} // namespace resource::compile

#include "compiled_artifact.hpp"

#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"

namespace resource::compiled {

stream::StreamPtr CompiledArtifact::OpenStream() const {
  return std::make_unique<stream::BufferStream>(payload ? payload : std::make_shared<arrow::Buffer>(nullptr, 0));
}

std::shared_ptr<arrow::Buffer> CompiledArtifact::Section(std::string_view name) const {
  for (const auto& section : record.sections()) {
    if (section.name() == name) {
      return arrow::SliceBuffer(payload, static_cast<int64_t>(section.offset()), static_cast<int64_t>(section.length()));
    }
  }
  throw util::NotFound("artifact has no section " + std::string(name));
}

void ValidateSections(const CompiledArtifact& artifact) {
  const uint64_t size = artifact.payload ? static_cast<uint64_t>(artifact.payload->size()) : 0;
  for (const auto& section : artifact.record.sections()) {
    if (section.offset() > size || section.length() > size - section.offset()) {
      throw util::InvalidState("section " + section.name() + " lies outside the artifact payload");
    }
  }
}

} // namespace resource::compiled

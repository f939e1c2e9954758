#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/stream/stream.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::compiled {

/*
  A compiled resource: index record plus the artifact bytes. Sections
  in the record are (offset, length) slices of payload.
*/
struct CompiledArtifact {
  resource::pipeline::v1::CompiledRecord record;
  std::shared_ptr<arrow::Buffer>         payload;

  stream::StreamPtr OpenStream() const;

  // Zero-copy slice; throws util::NotFound for an unknown section name.
  std::shared_ptr<arrow::Buffer> Section(std::string_view name) const;
};

// Throws util::InvalidState if a section lies outside the payload.
void ValidateSections(const CompiledArtifact& artifact);

} // namespace resource::compiled

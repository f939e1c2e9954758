#pragma once

#include <functional>
#include <vector>

#include "internal/compiled/compiled_artifact.hpp"
#include "internal/stream/stream.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::bundle {

/*
  Immutable ordered set of compiled artifacts, at most one per
  ResourceID.
*/
class Bundle {
 public:
  // Throws util::Conflict for a repeated ResourceID.
  explicit Bundle(std::vector<compiled::CompiledArtifact> entries);

  const std::vector<compiled::CompiledArtifact>& Entries() const {
    return entries_;
  }

  size_t Size() const {
    return entries_.size();
  }

  // nullptr if the bundle has no entry for id.
  const compiled::CompiledArtifact* Find(const resource::pipeline::v1::ResourceID& id) const;

 private:
  std::vector<compiled::CompiledArtifact> entries_;
};

using ArtifactProvider = std::function<compiled::CompiledArtifact(const resource::pipeline::v1::ResourceKey&)>;

/*
  Collects artifacts through the provider (usually a compile pipeline)
  in key order.
*/
class BundleBuilder {
 public:
  explicit BundleBuilder(ArtifactProvider provider);

  Bundle Build(const std::vector<resource::pipeline::v1::ResourceKey>& keys) const;

 private:
  ArtifactProvider provider_;
};

/*
  Archive layout:

    "RSBNDL01"
    u32 BE  index length
    BundleIndex (record + offset per entry)
    artifact bytes, concatenated in entry order
*/
void WriteBundle(const Bundle& bundle, stream::Stream& out);

// Throws util::ProtocolError for a malformed archive.
Bundle ReadBundle(stream::Stream& in);

} // namespace resource::bundle

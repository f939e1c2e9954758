#include "bundle.hpp"

#include <cstring>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::bundle {

using compiled::CompiledArtifact;
using resource::pipeline::v1::BundleIndex;

namespace {

constexpr char    kMagic[]    = "RSBNDL01";
constexpr int64_t kMagicBytes = 8;

// Index size cap; anything larger is not a bundle written by us.
constexpr uint32_t kMaxIndexBytes = 64u * 1024u * 1024u;

} // namespace

Bundle::Bundle(std::vector<CompiledArtifact> entries) : entries_(std::move(entries)) {
  std::unordered_set<std::string> seen;
  for (const auto& entry : entries_) {
    if (!seen.insert(entry.record.key().id().value()).second) {
      throw util::Conflict("duplicate resource in bundle: " + util::Describe(entry.record.key().id()));
    }
  }
}

const CompiledArtifact* Bundle::Find(const resource::pipeline::v1::ResourceID& id) const {
  for (const auto& entry : entries_) {
    if (entry.record.key().id().value() == id.value()) return &entry;
  }
  return nullptr;
}

BundleBuilder::BundleBuilder(ArtifactProvider provider) : provider_(std::move(provider)) {
  if (!provider_) throw util::InvalidState("bundle builder requires an artifact provider");
}

Bundle BundleBuilder::Build(const std::vector<resource::pipeline::v1::ResourceKey>& keys) const {
  // reject duplicates before compiling anything
  std::unordered_set<std::string> seen;
  for (const auto& key : keys) {
    if (!seen.insert(key.id().value()).second) {
      throw util::Conflict("duplicate resource in bundle: " + util::Describe(key.id()));
    }
  }

  std::vector<CompiledArtifact> entries;
  entries.reserve(keys.size());
  for (const auto& key : keys) {
    entries.push_back(provider_(key));
  }
  return Bundle(std::move(entries));
}

void WriteBundle(const Bundle& bundle, stream::Stream& out) {
  BundleIndex index;
  uint64_t    offset = 0;
  for (const auto& entry : bundle.Entries()) {
    auto* indexed             = index.add_entries();
    *indexed->mutable_record() = entry.record;
    indexed->mutable_record()->set_size_bytes(entry.payload ? static_cast<uint64_t>(entry.payload->size()) : 0);
    indexed->set_offset(offset);
    offset += indexed->record().size_bytes();
  }

  const std::string encoded = index.SerializeAsString();
  if (encoded.size() > kMaxIndexBytes) throw util::InvalidState("bundle index too large");

  std::string header(kMagic, kMagicBytes);
  const auto  length = static_cast<uint32_t>(encoded.size());
  header.push_back(static_cast<char>((length >> 24) & 0xFF));
  header.push_back(static_cast<char>((length >> 16) & 0xFF));
  header.push_back(static_cast<char>((length >> 8) & 0xFF));
  header.push_back(static_cast<char>(length & 0xFF));

  out.Write(header);
  out.Write(encoded);
  for (const auto& entry : bundle.Entries()) {
    if (entry.payload && entry.payload->size() > 0) out.Write(*entry.payload);
  }
}

Bundle ReadBundle(stream::Stream& in) {
  std::shared_ptr<arrow::Buffer> header;
  try {
    header = in.ReadExact(kMagicBytes + 4);
  } catch (const util::Unavailable&) {
    throw util::ProtocolError("truncated bundle header");
  }
  if (std::memcmp(header->data(), kMagic, kMagicBytes) != 0) throw util::ProtocolError("not a resource bundle");

  const uint8_t* p      = header->data() + kMagicBytes;
  const uint32_t length = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) | p[3];
  if (length > kMaxIndexBytes) throw util::ProtocolError("bundle index too large");

  BundleIndex index;
  if (length > 0) {
    std::shared_ptr<arrow::Buffer> encoded;
    try {
      encoded = in.ReadExact(length);
    } catch (const util::Unavailable&) {
      throw util::ProtocolError("truncated bundle index");
    }
    if (!index.ParseFromArray(encoded->data(), static_cast<int>(encoded->size()))) throw util::ProtocolError("corrupt bundle index");
  }

  auto data = in.ReadAll();

  std::vector<CompiledArtifact> entries;
  entries.reserve(static_cast<size_t>(index.entries_size()));
  for (const auto& indexed : index.entries()) {
    const uint64_t size = indexed.record().size_bytes();
    if (indexed.offset() > static_cast<uint64_t>(data->size()) || size > static_cast<uint64_t>(data->size()) - indexed.offset()) {
      throw util::ProtocolError("bundle entry outside data section");
    }

    CompiledArtifact artifact;
    artifact.record  = indexed.record();
    artifact.payload = arrow::SliceBuffer(data, static_cast<int64_t>(indexed.offset()), static_cast<int64_t>(size));
    try {
      compiled::ValidateSections(artifact);
    } catch (const util::InvalidState& e) {
      throw util::ProtocolError(std::string("corrupt bundle entry: ") + e.what());
    }
    entries.push_back(std::move(artifact));
  }

  try {
    return Bundle(std::move(entries));
  } catch (const util::Conflict& e) {
    throw util::ProtocolError(std::string("corrupt bundle: ") + e.what());
  }
}

} // namespace resource::bundle

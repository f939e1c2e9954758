#include <arrow/buffer_builder.h>

#include "internal/compile/compiler_registry.hpp"
#include "internal/source/properties.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace resource::compile {

namespace {

using resource::pipeline::v1::Section;

Section MakeSection(const std::string& name, uint64_t offset, uint64_t length) {
  Section section;
  section.set_name(name);
  section.set_offset(offset);
  section.set_length(length);
  return section;
}

CompileOutput CompileBlob(const CompileInput& input) {
  CompileOutput output;
  output.payload = input.payload;
  output.sections.push_back(MakeSection("static", 0, static_cast<uint64_t>(input.payload->size())));
  return output;
}

CompileOutput CompileProperties(const CompileInput& input) {
  const auto json = source::SerializeProperties(source::ToProperties(input.record.properties()));

  arrow::BufferBuilder builder;
  storage::common::Unwrap(builder.Append(input.payload->data(), input.payload->size()));
  storage::common::Unwrap(builder.Append(json.data(), static_cast<int64_t>(json.size())));

  CompileOutput output;
  output.payload = storage::common::Unwrap(builder.Finish());
  output.sections.push_back(MakeSection("static", 0, static_cast<uint64_t>(input.payload->size())));
  output.sections.push_back(MakeSection("dynamic", static_cast<uint64_t>(input.payload->size()), json.size()));
  return output;
}

} // namespace

void RegisterBuiltinCompilers(CompilerRegistry& registry) {
  registry.Register("blob", 0, CompileBlob);
  registry.Register("properties", 0, CompileProperties);
}

} // namespace resource::compile

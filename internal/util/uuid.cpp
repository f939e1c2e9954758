#include "uuid.hpp"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace resource::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  UUID        id{};
  std::string hex;

  for (char c : str) {
    if (c == '-') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) throw InvalidState("invalid UUID string: " + str);
    hex += c;
  }

  if (hex.size() != 32) throw InvalidState("invalid UUID string: " + str);

  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));

  return id;
}

resource::pipeline::v1::ResourceID ToProto(const UUID& id) {
  resource::pipeline::v1::ResourceID p;
  p.set_value(id.data(), id.size());
  return p;
}

UUID FromProto(const resource::pipeline::v1::ResourceID& p) {
  if (p.value().size() != 16) throw InvalidState("invalid ResourceID size");

  UUID id{};
  std::memcpy(id.data(), p.value().data(), 16);
  return id;
}

resource::pipeline::v1::ResourceID NewResourceID() {
  return ToProto(GenerateUUID());
}

resource::pipeline::v1::ResourceID ParseResourceID(const std::string& str) {
  return ToProto(FromString(str));
}

std::string Describe(const resource::pipeline::v1::ResourceID& id) {
  if (id.value().size() != 16) return "<invalid>";
  return ToString(FromProto(id));
}

} // namespace resource::util

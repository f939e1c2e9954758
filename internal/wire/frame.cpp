#include "frame.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

#include "internal/util/errors.hpp"

namespace resource::wire {

namespace {

constexpr int64_t kLengthBytes = 4;

void PutU32(std::string& out, uint32_t value) {
  out.push_back(static_cast<char>((value >> 24) & 0xFF));
  out.push_back(static_cast<char>((value >> 16) & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
  out.push_back(static_cast<char>(value & 0xFF));
}

uint32_t GetU32(const uint8_t* data) {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) | (static_cast<uint32_t>(data[2]) << 8) |
         static_cast<uint32_t>(data[3]);
}

/*
  Reads the length prefix. A clean end of stream before the first byte
  is not an error, anything after it is.
*/
std::optional<uint32_t> ReadLength(stream::Stream& stream) {
  auto first = stream.Read(kLengthBytes);
  if (!first) return std::nullopt;

  uint8_t header[kLengthBytes];
  int64_t have = (*first)->size();
  std::copy((*first)->data(), (*first)->data() + have, header);
  if (have < kLengthBytes) {
    auto rest = stream.ReadExact(kLengthBytes - have);
    std::copy(rest->data(), rest->data() + rest->size(), header + have);
  }
  return GetU32(header);
}

std::optional<Frame> ReadFrame(stream::Stream& stream, uint32_t max_frame_bytes, bool with_status) {
  auto length = ReadLength(stream);
  if (!length) return std::nullopt;

  const uint32_t header_bytes = with_status ? 2 : 1;
  if (*length < header_bytes) {
    throw util::ProtocolError("frame too short: " + std::to_string(*length) + " bytes");
  }
  if (*length > max_frame_bytes) {
    throw util::ProtocolError("frame of " + std::to_string(*length) + " bytes exceeds limit of " + std::to_string(max_frame_bytes));
  }

  auto header = stream.ReadExact(header_bytes);
  if (!IsKnownOpcode(header->data()[0])) {
    throw util::ProtocolError("unknown opcode " + std::to_string(header->data()[0]));
  }

  Frame frame;
  frame.opcode = static_cast<Opcode>(header->data()[0]);
  if (with_status) {
    const uint8_t status = header->data()[1];
    if (status > static_cast<uint8_t>(Status::kError)) {
      throw util::ProtocolError("unknown status " + std::to_string(status));
    }
    frame.status = static_cast<Status>(status);
  }

  const int64_t payload_bytes = static_cast<int64_t>(*length - header_bytes);
  frame.payload               = payload_bytes > 0 ? stream.ReadExact(payload_bytes) : std::make_shared<arrow::Buffer>(nullptr, 0);
  return frame;
}

void WriteFrame(stream::Stream& stream, Opcode opcode, std::optional<Status> status, std::string_view payload) {
  const uint64_t length = payload.size() + (status ? 2 : 1);
  if (length > UINT32_MAX) throw util::ProtocolError("payload too large for a frame");

  std::string header;
  header.reserve(kLengthBytes + 2);
  PutU32(header, static_cast<uint32_t>(length));
  header.push_back(static_cast<char>(opcode));
  if (status) header.push_back(static_cast<char>(*status));

  stream.Write(header);
  if (!payload.empty()) stream.Write(payload);
}

} // namespace

std::string_view OpcodeName(Opcode opcode) {
  switch (opcode) {
    case Opcode::kFetchSource:
      return "fetch_source";
    case Opcode::kStoreSource:
      return "store_source";
    case Opcode::kGetCompiled:
      return "get_compiled";
    case Opcode::kPutCompiled:
      return "put_compiled";
    case Opcode::kSubscribe:
      return "subscribe";
    case Opcode::kRemoveSource:
      return "remove_source";
    case Opcode::kCompile:
      return "compile";
    case Opcode::kCurrentCounter:
      return "current_counter";
  }
  return "unknown";
}

std::string_view StatusName(Status status) {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kNotFound:
      return "not_found";
    case Status::kStale:
      return "stale";
    case Status::kUnavailable:
      return "unavailable";
    case Status::kError:
      return "error";
  }
  return "unknown";
}

bool IsKnownOpcode(uint8_t value) {
  return value >= static_cast<uint8_t>(Opcode::kFetchSource) && value <= static_cast<uint8_t>(Opcode::kCurrentCounter);
}

bool IsReplaySafe(Opcode opcode) {
  // a replayed remove finds the tombstone it left and reports not found
  return opcode != Opcode::kRemoveSource;
}

std::optional<Frame> ReadRequest(stream::Stream& stream, uint32_t max_frame_bytes) {
  return ReadFrame(stream, max_frame_bytes, /*with_status=*/false);
}

std::optional<Frame> ReadResponse(stream::Stream& stream, uint32_t max_frame_bytes) {
  return ReadFrame(stream, max_frame_bytes, /*with_status=*/true);
}

void WriteRequest(stream::Stream& stream, Opcode opcode, std::string_view payload) {
  WriteFrame(stream, opcode, std::nullopt, payload);
}

void WriteResponse(stream::Stream& stream, Opcode opcode, Status status, std::string_view payload) {
  WriteFrame(stream, opcode, status, payload);
}

} // namespace resource::wire

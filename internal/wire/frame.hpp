#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/stream/stream.hpp"

namespace resource::wire {

/*
  Wire framing.

    request:   [u32 BE length][u8 opcode][payload]
    response:  [u32 BE length][u8 opcode][u8 status][payload]

  length counts every byte after the length field itself. Payloads are
  serialized protobuf messages from resource/pipeline/wire/v1.
*/

enum class Opcode : uint8_t {
  kFetchSource    = 1,
  kStoreSource    = 2,
  kGetCompiled    = 3,
  kPutCompiled    = 4,
  kSubscribe      = 5,
  kRemoveSource   = 6,
  kCompile        = 7,
  kCurrentCounter = 8,
};

enum class Status : uint8_t {
  kOk          = 0,
  kNotFound    = 1,
  kStale       = 2,
  kUnavailable = 3,
  kError       = 4,
};

struct Frame {
  Opcode                         opcode = Opcode::kFetchSource;
  Status                         status = Status::kOk;
  std::shared_ptr<arrow::Buffer> payload;
};

std::string_view OpcodeName(Opcode opcode);
std::string_view StatusName(Status status);

bool IsKnownOpcode(uint8_t value);

// False for requests whose replay can observe their own first effect.
bool IsReplaySafe(Opcode opcode);

/*
  Read one request frame.

  Returns std::nullopt when the peer closed the stream cleanly before a
  new frame started. Throws util::ProtocolError for an empty frame, a
  frame over max_frame_bytes or an unknown opcode, and util::Unavailable
  when the stream ends inside a frame.
*/
std::optional<Frame> ReadRequest(stream::Stream& stream, uint32_t max_frame_bytes);

// Same as ReadRequest, with the status byte. Also rejects unknown statuses.
std::optional<Frame> ReadResponse(stream::Stream& stream, uint32_t max_frame_bytes);

void WriteRequest(stream::Stream& stream, Opcode opcode, std::string_view payload);
void WriteResponse(stream::Stream& stream, Opcode opcode, Status status, std::string_view payload);

} // namespace resource::wire

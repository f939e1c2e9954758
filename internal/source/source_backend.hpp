#pragma once

#include <cstdint>
#include <memory>

#include "internal/event/event_channel.hpp"
#include "internal/source/properties.hpp"
#include "internal/stream/stream.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::source {

struct SourceResource {
  resource::pipeline::v1::SourceRecord record;
  stream::StreamPtr                    payload;
};

/*
  Source backend abstraction.

  Implementations:
    LocalSourceBackend   -> blob store + metadata repository
    RemoteSourceBackend  -> sourced over the wire protocol

  Errors:
    util::NotFound     unknown (or removed) id
    util::Unavailable  backend unreachable; a remote backend never
                       reports a lost connection as NotFound
*/
class SourceBackend {
 public:
  virtual ~SourceBackend() = default;

  virtual SourceResource Fetch(const resource::pipeline::v1::ResourceID& id) = 0;

  /*
    Store properties and payload. Returns the resulting change counter.
    Content identical to the current version keeps the counter and
    emits no event.
  */
  virtual uint64_t Store(const resource::pipeline::v1::ResourceID& id, const Properties& properties, stream::Stream& payload) = 0;

  // Returns the counter of the Removed event.
  virtual uint64_t Remove(const resource::pipeline::v1::ResourceID& id) = 0;

  virtual uint64_t CurrentCounter(const resource::pipeline::v1::ResourceID& id) = 0;

  /*
    Change events matching filter. The subscription ends when the channel
    is closed or dropped. A Resync event means events were lost.
  */
  virtual event::EventChannelPtr Subscribe(const resource::pipeline::v1::EventFilter& filter) = 0;
};

using SourceBackendPtr = std::shared_ptr<SourceBackend>;

} // namespace resource::source

#include "source_event_relay.hpp"

#include "internal/compiled/compiled_backend.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/source_backend.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::event {

using namespace resource::pipeline::v1;
using resource::observability::StringField;

SourceEventRelay::SourceEventRelay(std::shared_ptr<source::SourceBackend> source, std::shared_ptr<compiled::CompiledBackend> compiled,
                                   EventBusPtr bus, std::chrono::milliseconds retry_backoff)
    : source_(std::move(source)), compiled_(std::move(compiled)), bus_(std::move(bus)), retry_backoff_(retry_backoff) {
  if (!source_ || !compiled_ || !bus_) throw util::InvalidState("source event relay requires source, compiled backend and bus");
}

SourceEventRelay::~SourceEventRelay() {
  Stop();
}

void SourceEventRelay::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SourceEventRelay::Run, this);
}

void SourceEventRelay::Stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) thread_.join();
    return;
  }

  EventChannelPtr channel;
  {
    std::lock_guard lock(mutex_);
    channel = channel_;
  }
  if (channel) channel->Close();
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
}

void SourceEventRelay::Run() {
  while (running_) {
    try {
      auto channel = source_->Subscribe(EventFilter{});
      {
        std::lock_guard lock(mutex_);
        channel_ = channel;
      }
      // Stop() may have run before the channel was published
      if (!running_) channel->Close();

      RESOURCE_LOG_INFO("source subscription established");
      while (auto event = channel->Pop()) {
        Relay(*event);
      }

      std::lock_guard lock(mutex_);
      channel_.reset();
    } catch (const std::exception& e) {
      // a lost subscription already delivered its Resync through the channel
      RESOURCE_LOG_WARN("source subscription failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, retry_backoff_, [this] { return !running_; });
  }
}

void SourceEventRelay::Relay(const ChangeEvent& event) {
  if (event.kind() == CHANGE_KIND_REMOVED) {
    try {
      compiled_->Invalidate(event.id());
    } catch (const std::exception& e) {
      RESOURCE_LOG_ERROR("invalidate after remove failed", {StringField("resource_id", util::Describe(event.id())), StringField("error", e.what())});
    }
  }

  bus_->Publish(event);
  ++relayed_;
}

} // namespace resource::event

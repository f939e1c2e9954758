#pragma once

#include <memory>

namespace resource::source { class SourceBackend; }
namespace resource::compiled { class CompiledBackend; }
namespace resource::compile { class CompilePipeline; }
namespace resource::event { class EventBus; }

namespace resource::service {

/*
  Dependency container shared by all services.

  sourced fills source only. compiled fills every field; its source is
  the remote source backend and events is the local relay bus.
*/
struct ServiceContext {
  std::shared_ptr<resource::source::SourceBackend>     source;
  std::shared_ptr<resource::compiled::CompiledBackend> compiled;
  std::shared_ptr<resource::compile::CompilePipeline>  pipeline;
  std::shared_ptr<resource::event::EventBus>           events;
};

} // namespace resource::service

#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/compile/compile_pipeline.hpp"
#include "internal/compiled/compiled_backend.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/event/source_event_relay.hpp"
#include "internal/runtime/dispatcher.hpp"
#include "internal/source/source_backend.hpp"

namespace resource::factory {

/*
  Backends selected by the source/compiled sections of a config.

  pipeline is null when the compiled backend is remote; compiles then
  run inside the compiled daemon.
*/
struct PipelineStack {
  event::EventBusPtr           bus;
  source::SourceBackendPtr     source;
  compiled::CompiledBackendPtr compiled;
  compile::CompilePipelinePtr  pipeline;
};

/*
  Application

  Owns all long-lived objects of one daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  PipelineStack                            stack;
  runtime::DispatcherPtr                   dispatcher;
  std::shared_ptr<event::SourceEventRelay> relay; // compiled daemon only
};

// SQLite when a path is configured, in-memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const resource::runtime::config::SqliteConfig& sqlite);

source::SourceBackendPtr BuildSourceBackend(const resource::runtime::config::RuntimeConfig& config, const event::EventBusPtr& bus);

compiled::CompiledBackendPtr BuildCompiledBackend(const resource::runtime::config::RuntimeConfig& config, const source::SourceBackendPtr& source);

compile::CompilerRegistryPtr BuildCompilerRegistry();

PipelineStack BuildPipelineStack(const resource::runtime::config::RuntimeConfig& config);

// Replaces the source/compiled sections of base with a backend location.
resource::runtime::config::RuntimeConfig ConfigForLocation(const resource::runtime::config::RuntimeConfig& base,
                                                           const resource::runtime::config::BackendLocation& location);

/*
  Composition roots of the two daemons. These are the ONLY places that
  know which concrete backends a daemon serves.
*/
Application BuildSourceDaemon(const resource::runtime::config::RuntimeConfig& config);
Application BuildCompiledDaemon(const resource::runtime::config::RuntimeConfig& config);

} // namespace resource::factory

#include "factory.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/compile/compiler_registry.hpp"
#include "internal/compiled/local_compiled_backend.hpp"
#include "internal/compiled/remote_compiled_backend.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/compiled_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/source_service.hpp"
#include "internal/source/local_source_backend.hpp"
#include "internal/source/remote_source_backend.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/client.hpp"
#if RESOURCE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace resource::factory {

using resource::observability::StringField;
using resource::runtime::config::BackendLocation;
using resource::runtime::config::RuntimeConfig;
using resource::runtime::config::StorageTier;

namespace {

storage::Tier ToTier(StorageTier tier) {
  switch (tier) {
    case resource::runtime::config::STORAGE_TIER_RAM:
      return storage::Tier::kRam;
    case resource::runtime::config::STORAGE_TIER_DISK:
    case resource::runtime::config::STORAGE_TIER_UNSPECIFIED:
    default:
      return storage::Tier::kDisk;
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const resource::runtime::config::SqliteConfig& sqlite) {
  if (!sqlite.path().empty()) {
#if RESOURCE_DB_SQLITE
    const std::filesystem::path path(sqlite.path());
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

source::SourceBackendPtr BuildSourceBackend(const RuntimeConfig& config, const event::EventBusPtr& bus) {
  const auto& source = config.source();
  if (source.has_remote()) {
    return std::make_shared<source::RemoteSourceBackend>(source.remote(), wire::ClientOptions::FromConfig(config.remote()),
                                                         config.events().queue_capacity());
  }
  if (!source.has_local()) throw util::InvalidState("configuration has no source backend");

  auto store   = storage::StorageFactory::Build(storage::Tier::kDisk, source.local().root_path());
  auto backend = std::make_shared<source::LocalSourceBackend>(std::move(store), BuildRepository(source.local().sqlite()), bus);
  backend->Hydrate();
  return backend;
}

compiled::CompiledBackendPtr BuildCompiledBackend(const RuntimeConfig& config, const source::SourceBackendPtr& source) {
  const auto& compiled = config.compiled();
  if (compiled.has_remote()) {
    return std::make_shared<compiled::RemoteCompiledBackend>(compiled.remote(), wire::ClientOptions::FromConfig(config.remote()));
  }
  if (!compiled.has_local()) throw util::InvalidState("configuration has no compiled backend");

  const auto&              local = compiled.local();
  compiled::EvictionPolicy policy;
  policy.capacity_bytes = local.capacity_bytes();
  policy.max_age        = std::chrono::milliseconds(local.max_age_ms());

  auto store   = storage::StorageFactory::Build(ToTier(local.tier()), local.root_path());
  auto backend = std::make_shared<compiled::LocalCompiledBackend>(std::move(store), BuildRepository(local.sqlite()), source,
                                                                  config.pipeline().compiler_version(), policy);
  backend->Hydrate();
  return backend;
}

compile::CompilerRegistryPtr BuildCompilerRegistry() {
  auto registry = std::make_shared<compile::CompilerRegistry>();
  compile::RegisterBuiltinCompilers(*registry);
  return registry;
}

PipelineStack BuildPipelineStack(const RuntimeConfig& config) {
  PipelineStack stack;
  stack.bus      = std::make_shared<event::EventBus>(config.events().queue_capacity());
  stack.source   = BuildSourceBackend(config, stack.bus);
  stack.compiled = BuildCompiledBackend(config, stack.source);

  if (config.compiled().has_local()) {
    stack.pipeline = std::make_shared<compile::CompilePipeline>(stack.source, stack.compiled, BuildCompilerRegistry(),
                                                                config.pipeline().compiler_version());
  }
  return stack;
}

RuntimeConfig ConfigForLocation(const RuntimeConfig& base, const BackendLocation& location) {
  RuntimeConfig config = base;

  switch (location.kind_case()) {
    case BackendLocation::kLocal: {
      const std::filesystem::path root(location.local().root_path());

      auto* source = config.mutable_source()->mutable_local();
      source->set_root_path((root / "source").string());
      source->mutable_sqlite()->set_path((root / "source.db").string());

      const auto tier           = base.compiled().has_local() ? base.compiled().local().tier() : resource::runtime::config::STORAGE_TIER_DISK;
      const auto capacity_bytes = base.compiled().has_local() ? base.compiled().local().capacity_bytes() : 0;
      const auto max_age_ms     = base.compiled().has_local() ? base.compiled().local().max_age_ms() : 0;

      auto* compiled = config.mutable_compiled()->mutable_local();
      compiled->set_root_path((root / "compiled").string());
      compiled->set_tier(tier);
      compiled->set_capacity_bytes(capacity_bytes);
      compiled->set_max_age_ms(max_age_ms);
      compiled->mutable_sqlite()->set_path((root / "compiled.db").string());
      break;
    }
    case BackendLocation::kRemote:
      *config.mutable_source()->mutable_remote()   = location.remote().source();
      *config.mutable_compiled()->mutable_remote() = location.remote().compiled();
      break;
    case BackendLocation::KIND_NOT_SET:
      break;
  }
  return config;
}

Application BuildSourceDaemon(const RuntimeConfig& config) {
  if (!config.source().has_local()) throw util::InvalidState("sourced requires a local source backend");

  Application app;
  app.stack.bus    = std::make_shared<event::EventBus>(config.events().queue_capacity());
  app.stack.source = BuildSourceBackend(config, app.stack.bus);

  service::ServiceContext ctx;
  ctx.source = app.stack.source;

  app.dispatcher = std::make_shared<runtime::SourceDispatcher>(std::make_shared<service::SourceService>(ctx));
  return app;
}

Application BuildCompiledDaemon(const RuntimeConfig& config) {
  if (!config.compiled().has_local()) throw util::InvalidState("compiled requires a local compiled backend");

  Application app;
  app.stack = BuildPipelineStack(config);

  // Relayed events go to a bus of their own: with a local source the
  // stack bus is the one the relay reads from.
  auto events = std::make_shared<event::EventBus>(config.events().queue_capacity());
  app.relay   = std::make_shared<event::SourceEventRelay>(app.stack.source, app.stack.compiled, events,
                                                          std::chrono::milliseconds(config.remote().retry_backoff_ms()) * 10);

  service::ServiceContext ctx;
  ctx.source   = app.stack.source;
  ctx.compiled = app.stack.compiled;
  ctx.pipeline = app.stack.pipeline;
  ctx.events   = events;

  app.dispatcher = std::make_shared<runtime::CompiledDispatcher>(std::make_shared<service::CompiledService>(ctx));

  RESOURCE_LOG_INFO("compiled daemon assembled", {StringField("source", config.source().has_remote() ? "remote" : "local")});
  return app;
}

} // namespace resource::factory

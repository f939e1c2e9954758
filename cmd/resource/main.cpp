#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/resource_client.h"
#include "internal/compiled/compiled_key.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/identity/resource_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stream/file_stream.hpp"
#include "internal/util/uuid.hpp"

using namespace resource::pipeline::v1;
using resource::client::ResourceClient;

namespace {

constexpr int kExitOk             = 0;
constexpr int kExitUsage          = 1;
constexpr int kExitNotFound       = 2;
constexpr int kExitUnavailable    = 3;
constexpr int kExitStale          = 4;
constexpr int kExitCompileFailure = 5;
constexpr int kExitError          = 6;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cout << "Usage:\n"
            << "  resource --config <config.yaml> store <uuid> <file> [--type T] [--property k=v]...\n"
            << "  resource --config <config.yaml> fetch <uuid> [--out file]\n"
            << "  resource --config <config.yaml> remove <uuid>\n"
            << "  resource --config <config.yaml> compile <uuid> [--platform N]\n"
            << "  resource --config <config.yaml> get <uuid> [--platform N]\n"
            << "  resource --config <config.yaml> bundle <out> <uuid[:platform]>...\n"
            << "  resource --config <config.yaml> unbundle <file>\n"
            << "  resource --config <config.yaml> watch [uuid]\n"
            << "  resource uuid\n";
}

int ExitCode(const arrow::Status& status) {
  std::cerr << status.ToString() << "\n";
  if (status.IsKeyError()) return kExitNotFound;
  if (status.IsIOError()) return kExitUnavailable;
  if (status.IsCancelled()) return kExitStale;
  if (status.IsExecutionError()) return kExitCompileFailure;
  return kExitError;
}

std::optional<uint64_t> ParsePlatform(const std::string& value) {
  try {
    size_t     used     = 0;
    const auto platform = std::stoull(value, &used, 0);
    if (used != value.size()) return std::nullopt;
    return platform;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

void PrintRecord(const CompiledRecord& record) {
  std::cout << "key " << resource::compiled::DescribeKey(record.key()) << "\n"
            << "source_change_counter " << record.source_change_counter() << "\n"
            << "compiler_version " << record.compiler_version() << "\n"
            << "size_bytes " << record.size_bytes() << "\n";
  for (const auto& section : record.sections()) {
    std::cout << "section " << section.name() << " offset=" << section.offset() << " length=" << section.length() << "\n";
  }
}

std::string_view KindName(ChangeKind kind) {
  switch (kind) {
    case CHANGE_KIND_ADDED:
      return "added";
    case CHANGE_KIND_MODIFIED:
      return "modified";
    case CHANGE_KIND_REMOVED:
      return "removed";
    case CHANGE_KIND_RESYNC:
      return "resync";
    default:
      return "unspecified";
  }
}

// <uuid>[:platform]
std::optional<ResourceKey> ParseKeyArg(const std::string& arg) {
  ResourceKey key;
  const auto  colon = arg.find(':');

  auto id = resource::client::ParseResourceID(arg.substr(0, colon));
  if (!id.ok()) return std::nullopt;
  *key.mutable_id() = *id;

  if (colon != std::string::npos) {
    auto platform = ParsePlatform(arg.substr(colon + 1));
    if (!platform) return std::nullopt;
    key.set_platform(*platform);
  }
  return key;
}

int RunStore(const ResourceClient& client, const std::vector<std::string>& args) {
  if (args.size() < 2) return kExitUsage;

  auto id = resource::client::ParseResourceID(args[0]);
  if (!id.ok()) return ExitCode(id.status());

  resource::source::Properties properties;
  for (size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--type" && i + 1 < args.size()) {
      properties[resource::source::kTypeProperty] = args[++i];
    } else if (args[i] == "--property" && i + 1 < args.size()) {
      const auto& pair = args[++i];
      const auto  eq   = pair.find('=');
      if (eq == std::string::npos || eq == 0) return kExitUsage;
      properties[pair.substr(0, eq)] = pair.substr(eq + 1);
    } else {
      return kExitUsage;
    }
  }

  std::shared_ptr<arrow::Buffer> payload;
  try {
    payload = resource::stream::FileStream::OpenRead(args[1])->ReadAll();
  } catch (const std::exception& e) {
    std::cerr << "cannot read " << args[1] << ": " << e.what() << "\n";
    return kExitError;
  }

  auto counter = client.Store(*id, properties, std::move(payload));
  if (!counter.ok()) return ExitCode(counter.status());
  std::cout << "change_counter " << *counter << "\n";
  return kExitOk;
}

int RunFetch(const ResourceClient& client, const std::vector<std::string>& args) {
  if (args.empty() || (args.size() != 1 && (args.size() != 3 || args[1] != "--out"))) return kExitUsage;

  auto id = resource::client::ParseResourceID(args[0]);
  if (!id.ok()) return ExitCode(id.status());

  auto fetched = client.Fetch(*id);
  if (!fetched.ok()) return ExitCode(fetched.status());

  std::cerr << "change_counter " << fetched->record.change_counter() << " size_bytes " << fetched->record.size_bytes() << "\n";
  for (const auto& [key, value] : fetched->record.properties()) {
    std::cerr << "property " << key << "=" << value << "\n";
  }

  if (args.size() == 3) {
    try {
      auto out = resource::stream::FileStream::OpenWrite(args[2]);
      out->Write(*fetched->payload);
      out->Close();
    } catch (const std::exception& e) {
      std::cerr << "cannot write " << args[2] << ": " << e.what() << "\n";
      return kExitError;
    }
  } else {
    std::cout.write(reinterpret_cast<const char*>(fetched->payload->data()), fetched->payload->size());
  }
  return kExitOk;
}

int RunRemove(const ResourceClient& client, const std::vector<std::string>& args) {
  if (args.size() != 1) return kExitUsage;

  auto id = resource::client::ParseResourceID(args[0]);
  if (!id.ok()) return ExitCode(id.status());

  auto counter = client.Remove(*id);
  if (!counter.ok()) return ExitCode(counter.status());
  std::cout << "change_counter " << *counter << "\n";
  return kExitOk;
}

std::optional<ResourceKey> ParseKeyCommand(const std::vector<std::string>& args) {
  if (args.size() != 1 && (args.size() != 3 || args[1] != "--platform")) return std::nullopt;

  auto key = ParseKeyArg(args[0]);
  if (!key) return std::nullopt;
  if (args.size() == 3) {
    auto platform = ParsePlatform(args[2]);
    if (!platform) return std::nullopt;
    key->set_platform(*platform);
  }
  return key;
}

int RunCompile(const ResourceClient& client, const std::vector<std::string>& args) {
  auto key = ParseKeyCommand(args);
  if (!key) return kExitUsage;

  auto artifact = client.Compile(*key);
  if (!artifact.ok()) return ExitCode(artifact.status());
  PrintRecord(artifact->record);
  return kExitOk;
}

int RunGet(const ResourceClient& client, const std::vector<std::string>& args) {
  auto key = ParseKeyCommand(args);
  if (!key) return kExitUsage;

  auto lookup = client.Get(*key);
  if (!lookup.ok()) return ExitCode(lookup.status());

  std::cout << "status " << resource::compiled::LookupStatusName(lookup->status) << "\n";
  switch (lookup->status) {
    case resource::compiled::LookupStatus::kOk:
      PrintRecord(lookup->artifact->record);
      return kExitOk;
    case resource::compiled::LookupStatus::kStale:
      return kExitStale;
    case resource::compiled::LookupStatus::kNotFound:
      return kExitNotFound;
  }
  return kExitError;
}

int RunBundle(const ResourceClient& client, const std::vector<std::string>& args) {
  if (args.size() < 2) return kExitUsage;

  std::vector<ResourceKey> keys;
  for (size_t i = 1; i < args.size(); ++i) {
    auto key = ParseKeyArg(args[i]);
    if (!key) return kExitUsage;
    keys.push_back(*key);
  }

  auto status = client.WriteBundleFile(keys, args[0]);
  if (!status.ok()) return ExitCode(status);
  std::cout << "entries " << keys.size() << "\n";
  return kExitOk;
}

int RunUnbundle(const std::vector<std::string>& args) {
  if (args.size() != 1) return kExitUsage;

  auto bundle = ResourceClient::ReadBundleFile(args[0]);
  if (!bundle.ok()) return ExitCode(bundle.status());

  for (const auto& entry : bundle->Entries()) {
    PrintRecord(entry.record);
  }
  std::cout << "entries " << bundle->Size() << "\n";
  return kExitOk;
}

int RunWatch(const ResourceClient& client, const std::vector<std::string>& args) {
  if (args.size() > 1) return kExitUsage;

  EventFilter filter;
  if (args.size() == 1) {
    auto id = resource::client::ParseResourceID(args[0]);
    if (!id.ok()) return ExitCode(id.status());
    *filter.mutable_id() = *id;
  }

  auto channel = client.Watch(filter);
  if (!channel.ok()) return ExitCode(channel.status());

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  while (g_running) {
    auto event = (*channel)->PopFor(std::chrono::milliseconds(200));
    if (!event) {
      if ((*channel)->IsClosed()) {
        std::cerr << "subscription lost\n";
        return kExitUnavailable;
      }
      continue;
    }
    std::cout << KindName(event->kind()) << " " << resource::util::Describe(event->id()) << " counter=" << event->change_counter()
              << " namespace=" << event->resource_namespace() << std::endl;
  }

  (*channel)->Close();
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  if (args.size() == 1 && args[0] == "uuid") {
    std::cout << resource::util::ToString(resource::util::GenerateUUID()) << "\n";
    return kExitOk;
  }

  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = args[1];
  const std::string              command     = args[2];
  const std::vector<std::string> rest(args.begin() + 3, args.end());

  int code = kExitError;
  try {
    auto config = resource::config::ConfigLoader::LoadFromYaml(config_path);
    resource::observability::InitializeLogging(config, "resource");
    resource::identity::ResourceRegistry::Instance().Initialize(config);

    ResourceClient client(config);

    if (command == "store") {
      code = RunStore(client, rest);
    } else if (command == "fetch") {
      code = RunFetch(client, rest);
    } else if (command == "remove") {
      code = RunRemove(client, rest);
    } else if (command == "compile") {
      code = RunCompile(client, rest);
    } else if (command == "get") {
      code = RunGet(client, rest);
    } else if (command == "bundle") {
      code = RunBundle(client, rest);
    } else if (command == "unbundle") {
      code = RunUnbundle(rest);
    } else if (command == "watch") {
      code = RunWatch(client, rest);
    } else if (command == "uuid") {
      std::cout << resource::util::ToString(resource::util::GenerateUUID()) << "\n";
      code = kExitOk;
    } else {
      code = kExitUsage;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = kExitError;
  }

  if (code == kExitUsage) Usage();
  resource::identity::ResourceRegistry::Instance().Teardown();
  resource::observability::ShutdownLogging();
  return code;
}

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/capsule_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/error_codes.hpp"
#include "internal/util/time.hpp"

using capsule::core::ByTag;
using capsule::core::ByTimeOffset;
using capsule::core::ByVersionId;
using capsule::core::Latest;
using capsule::core::Selector;

static void Usage() {
  std::cout << "Usage:\n"
            << "  capsulectl <config.yaml> store <owner> <file>\n"
            << "  capsulectl <config.yaml> retrieve <owner> [latest | version <id> | tag <tag> | offset <seconds>] [--out <file>] [--strict]\n"
            << "  capsulectl <config.yaml> tag <owner> <version_id> <tag>\n"
            << "  capsulectl <config.yaml> untag <owner> <version_id> <tag>\n"
            << "  capsulectl <config.yaml> list <owner> [tag]\n"
            << "  capsulectl <config.yaml> delete <owner> <version_id>\n"
            << "  capsulectl <config.yaml> owners\n"
            << "  capsulectl <config.yaml> summary <owner>\n"
            << "  capsulectl <config.yaml> verify <owner> <version_id>\n"
            << "  capsulectl <config.yaml> reconcile [owner] [--repair]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot render " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

static void PrintVersion(const capsule::store::v1::CapsuleVersion& version) {
  std::cout << version.version_id() << " created_at=" << capsule::util::FormatTimestamp(version.created_at()) << " bytes=" << version.byte_size()
            << " fingerprint=" << version.fingerprint() << " tags=";
  for (int i = 0; i < version.tags_size(); ++i) {
    std::cout << (i == 0 ? "" : ",") << version.tags(i);
  }
  std::cout << "\n";
}

static std::optional<Selector> ParseSelector(const std::vector<std::string>& args, std::size_t& pos) {
  if (pos >= args.size() || args[pos].rfind("--", 0) == 0) {
    return Selector{Latest{}};
  }

  const auto& kind = args[pos++];
  if (kind == "latest") {
    return Selector{Latest{}};
  }
  if (pos >= args.size()) {
    return std::nullopt;
  }
  const auto& value = args[pos++];
  if (kind == "version") {
    return Selector{ByVersionId{value}};
  }
  if (kind == "tag") {
    return Selector{ByTag{value}};
  }
  if (kind == "offset") {
    try {
      return Selector{ByTimeOffset{std::chrono::seconds(std::stoll(value))}};
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("offset out of range: " + value);
    }
  }
  return std::nullopt;
}

static int Run(capsule::core::CapsuleStore& store, const std::string& cmd, const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "store") {
    if (args.size() < 2) return 1;

    auto content = capsule::storage::common::ReadFile(args[1]);
    std::cout << store.Store(args[0], content) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retrieve") {
    if (args.empty()) return 1;

    std::size_t pos      = 1;
    auto        selector = ParseSelector(args, pos);
    if (!selector) return 1;

    std::optional<std::string> out_path;
    bool                       strict = false;
    for (; pos < args.size(); ++pos) {
      if (args[pos] == "--strict") {
        strict = true;
      } else if (args[pos] == "--out" && pos + 1 < args.size()) {
        out_path = args[++pos];
      } else {
        std::cerr << "unexpected argument: " << args[pos] << "\n";
        return 1;
      }
    }

    auto result = store.Retrieve(args[0], *selector);
    if (strict) {
      result.RequireValid();
    }

    if (out_path) {
      capsule::storage::common::WriteFileAtomic(*out_path, std::string_view(reinterpret_cast<const char*>(result.content->data()),
                                                                            static_cast<std::size_t>(result.content->size())),
                                                false);
      std::cerr << "version=" << result.metadata.version_id() << " integrity_valid=" << (result.integrity_valid ? "true" : "false") << "\n";
    } else {
      std::cout.write(reinterpret_cast<const char*>(result.content->data()), result.content->size());
      std::cout.flush();
    }
    return result.integrity_valid ? 0 : capsule::util::ExitCode(capsule::util::ErrorCode::kIntegrityMismatch);
  }

  // ------------------------------------------------------------

  if (cmd == "tag" || cmd == "untag") {
    if (args.size() < 3) return 1;

    if (cmd == "tag") {
      store.AddTag(args[0], args[1], args[2]);
      std::cout << "tagged\n";
    } else {
      store.RemoveTag(args[0], args[1], args[2]);
      std::cout << "untagged\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (args.empty()) return 1;

    std::optional<std::string> tag;
    if (args.size() >= 2) tag = args[1];

    for (const auto& version : store.List(args[0], tag)) {
      PrintVersion(version);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (args.size() < 2) return 1;

    store.Delete(args[0], args[1]);
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "owners") {
    for (const auto& owner : store.ListOwners()) {
      std::cout << owner << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    if (args.empty()) return 1;

    std::cout << ToJson(store.Summary(args[0])) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "verify") {
    if (args.size() < 2) return 1;

    const bool valid = store.Verify(args[0], args[1]);
    std::cout << (valid ? "valid" : "MISMATCH") << "\n";
    return valid ? 0 : capsule::util::ExitCode(capsule::util::ErrorCode::kIntegrityMismatch);
  }

  // ------------------------------------------------------------

  if (cmd == "reconcile") {
    std::optional<std::string> owner;
    bool                       repair = false;
    for (const auto& arg : args) {
      if (arg == "--repair") {
        repair = true;
      } else {
        owner = arg;
      }
    }

    std::vector<capsule::store::v1::ReconciliationReport> reports;
    if (owner) {
      reports.push_back(store.Reconcile(*owner, repair));
    } else {
      reports = store.ReconcileAll(repair);
    }

    bool clean = true;
    for (const auto& report : reports) {
      std::cout << ToJson(report) << "\n";
      clean = clean && report.error().empty() && ((report.orphaned_blobs().empty() && report.dangling_versions().empty()) || report.repaired());
    }
    return clean ? 0 : capsule::util::ExitCode(capsule::util::ErrorCode::kCorruptIndex);
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = capsule::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }

    capsule::observability::InitializeTracing(config);
    capsule::observability::InitializeMetrics(config);
    capsule::observability::InitializeLogging(config);

    auto store = capsule::factory::BuildStore(config);
    exit_code  = Run(*store, cmd, args);
    if (exit_code == 1) {
      Usage();
    }
  } catch (const std::exception& e) {
    const auto code = capsule::util::Classify(e);
    std::cerr << capsule::util::ErrorCodeName(code) << ": " << e.what() << "\n";
    exit_code = capsule::util::ExitCode(code);
  }

  capsule::observability::ShutdownLogging();
  capsule::observability::ShutdownMetrics();
  capsule::observability::ShutdownTracing();
  return exit_code;
}

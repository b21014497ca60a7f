#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/core/capsule_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace {

std::string MakeCapsule(const std::string& owner, const std::string& mood) {
  return R"({"metadata":{"instance_name":")" + owner + R"(","capsule_version":"1.0.0","generator":"round-trip-example"},)" +
         R"("traits":{"curiosity":0.9},"personality":{"type":"INFJ"},)" + R"("memory":{"recent":["woke up"]},)" +
         R"("environment":{"mood":")" + mood + R"("}})";
}

} // namespace

int main(int argc, char** argv) {
  // A root path stores on disk; without one the store lives in memory.
  capsule::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    config.mutable_storage()->set_root_path(argv[1]);
    config.mutable_storage()->set_backend(capsule::runtime::config::STORAGE_BACKEND_DISK);
  } else {
    config.mutable_storage()->set_backend(capsule::runtime::config::STORAGE_BACKEND_MEMORY);
  }
  capsule::observability::InitializeLogging(config);

  try {
    auto store = capsule::factory::BuildStore(config);

    const std::string owner = "Nova";
    const auto        first = store->Store(owner, MakeCapsule(owner, "calm"));
    const auto        second = store->Store(owner, MakeCapsule(owner, "restless"));

    // Tag the older snapshot, then read it back through the tag.
    store->AddTag(owner, first, "post-mirror-break");

    auto tagged = store->Retrieve(owner, capsule::core::ByTag{"post-mirror-break"});
    auto latest = store->Retrieve(owner, capsule::core::Latest{});
    tagged.RequireValid();
    latest.RequireValid();

    std::cout << "tagged version:  " << tagged.metadata.version_id() << " (" << tagged.content->size() << " bytes)\n";
    std::cout << "latest version:  " << latest.metadata.version_id() << "\n";
    if (tagged.metadata.version_id() != first || latest.metadata.version_id() != second) {
      std::cerr << "unexpected resolution\n";
      return 1;
    }

    for (const auto& version : store->List(owner)) {
      std::cout << "  " << version.version_id() << " " << capsule::util::FormatTimestamp(version.created_at()) << " tags=" << version.tags_size()
                << "\n";
    }

    const auto summary = store->Summary(owner);
    std::cout << "versions=" << summary.version_count() << " bytes=" << summary.total_bytes() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "round trip failed: " << e.what() << '\n';
    return 1;
  }

  capsule::observability::ShutdownLogging();
  return 0;
}

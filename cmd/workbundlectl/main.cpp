#include <grpcpp/grpcpp.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/grpc/grpc_bundle_store.hpp"
#include "internal/work/bundle_manager.hpp"
#include "internal/work/name_formatter.hpp"
#include "internal/work/status_interpreter.hpp"
#include "workbundle/v1.hpp"

using namespace workbundle;

static constexpr std::chrono::milliseconds kDefaultCallTimeout{30000};

static void Usage() {
  std::cout << "Usage:\n"
            << "  workbundlectl <addr> name <owner> <namespace> <kind>\n"
            << "  workbundlectl <addr> ensure-namespace <owner> <namespace> <cluster>\n"
            << "  workbundlectl <addr> converge-vrg <owner> <namespace> <cluster> <vrg.yaml>\n"
            << "  workbundlectl <addr> bootstrap <cluster> <config.yaml>\n"
            << "  workbundlectl <addr> status <bundle> <cluster>\n"
            << "  workbundlectl <addr> delete <owner> <namespace> <cluster>\n";
}

static std::shared_ptr<store::BundleStore> Connect(const std::string& addr) {
  return std::make_shared<store::GrpcBundleStore>(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()));
}

static void PrintBundle(const v1::WorkBundle& bundle) {
  std::cout << "name=" << bundle.name() << " location=" << bundle.target_location()
            << " version=" << bundle.resource_version() << " manifests=" << bundle.manifests_size() << "\n";
  for (const auto& condition : bundle.status().conditions()) {
    std::cout << "  " << condition.type() << "=" << condition.status();
    if (!condition.reason().empty()) {
      std::cout << " reason=" << condition.reason();
    }
    std::cout << "\n";
  }
  std::cout << "applied=" << (work::IsApplied(bundle) ? "true" : "false") << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  observability::InitializeLogging(runtime::config::LoggingConfig{}, "workbundlectl");

  try {
    // ------------------------------------------------------------

    if (cmd == "name") {
      if (argc < 6) return 1;

      std::cout << work::BundleName(argv[3], argv[4], argv[5]) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "ensure-namespace") {
      if (argc < 6) return 1;

      work::BundleManager manager(Connect(addr), argv[3], argv[4]);
      auto outcome = manager.ConvergeNamespaceBundle(store::CallContext::WithTimeout(kDefaultCallTimeout), argv[3], argv[4], argv[5]);
      std::cout << work::ToString(outcome) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "converge-vrg") {
      if (argc < 7) return 1;

      v1::VolumeReplicationGroup vrg;
      config::ConfigLoader::LoadMessageFromYaml(argv[6], &vrg);

      work::BundleManager manager(Connect(addr), argv[3], argv[4]);
      auto outcome = manager.ConvergeVrgBundle(store::CallContext::WithTimeout(kDefaultCallTimeout), argv[3], argv[4], argv[5], vrg);
      std::cout << work::ToString(outcome) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "bootstrap") {
      if (argc < 5) return 1;

      const std::string cluster = argv[3];
      auto              config  = config::ConfigLoader::LoadFromYaml(argv[4]);

      auto timeout = kDefaultCallTimeout;
      if (config.broker().call_timeout_ms() > 0) {
        timeout = std::chrono::milliseconds(config.broker().call_timeout_ms());
      }

      work::BundleManager manager(Connect(addr), cluster, "");
      auto outcome = manager.ConvergeDrClusterBundle(store::CallContext::WithTimeout(timeout), cluster, config.ramen(),
                                                     config.ramen().dr_cluster_operator());
      std::cout << work::ToString(outcome) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "status") {
      if (argc < 5) return 1;

      work::BundleManager manager(Connect(addr), "", "");
      PrintBundle(manager.FindBundle(store::CallContext::WithTimeout(kDefaultCallTimeout), argv[3], argv[4]));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (argc < 6) return 1;

      work::BundleManager manager(Connect(addr), argv[3], argv[4]);
      auto outcome = manager.DeleteBundlesForCluster(store::CallContext::WithTimeout(kDefaultCallTimeout), argv[5]);
      std::cout << work::ToString(outcome) << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}

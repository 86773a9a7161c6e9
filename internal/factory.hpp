#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace settlement::core {
class SettlementEngine;
}
namespace settlement::oracle {
class LocalOracle;
}

namespace settlement::factory {

/*
  Everything the process keeps alive between Build() and shutdown.

  The local oracle's worker thread calls back into the engine, so it must
  be stopped before the engine goes away: Application::Stop() does that.
*/
struct Application {
  std::shared_ptr<core::SettlementEngine> engine;
  std::shared_ptr<oracle::LocalOracle>    local_oracle;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  void Stop();
};

/*
  Composition root. The ONLY place that knows concrete repository and
  oracle types.
*/
Application Build(const settlement::runtime::config::RuntimeConfig& config);

} // namespace settlement::factory

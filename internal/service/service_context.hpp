#pragma once

#include <memory>

namespace settlement::core {
class SettlementEngine;
}
namespace settlement::oracle {
class LocalOracle;
}

namespace settlement::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<settlement::core::SettlementEngine> engine;
  // null when the deployment talks to an external oracle
  std::shared_ptr<settlement::oracle::LocalOracle> local_oracle;
};

} // namespace settlement::service

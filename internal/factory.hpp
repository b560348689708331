#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cost/cost_calculator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/outward_flow_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/retry.hpp"

namespace outflow::factory {

/*
  Application

  Owns all long-lived singletons used by the engine.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  service::ServiceContext         context;

  std::shared_ptr<service::OutwardFlowService> outward_flow_service;
  std::shared_ptr<service::AdminService>       admin_service;
};

util::RetryPolicy BuildRetryPolicy(const outflow::runtime::config::RuntimeConfig& config);
cost::CostRates   BuildCostRates(const outflow::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const outflow::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire engine based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const outflow::runtime::config::RuntimeConfig& config);

// Same graph on top of an existing repository (tests, embedding).
Application Build(const outflow::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace outflow::factory

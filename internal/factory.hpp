#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/coordination_service.hpp"
#include "internal/store/coordination_store.hpp"
#include "internal/workflow/session_config.hpp"

namespace baton::factory {

/*
  Application

  Owns every long-lived object of the daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<store::CoordinationStore>      store;
  std::shared_ptr<workflow::SessionConfigCache>  configs;
  std::shared_ptr<core::Coordinator>             coordinator;
  std::shared_ptr<service::CoordinationService>  service;
  std::vector<std::unique_ptr<::grpc::Service>>  grpc_services;
};

// SQLite when configured (schema bootstrapped), the in-memory backend otherwise.
std::shared_ptr<db::Repository> BuildRepository(const baton::runtime::config::RuntimeConfig& config);

/*
  Composition root. The only place that knows concrete repository types.
  Throws ValidationError when the configured workflow is malformed.
*/
Application Build(const baton::runtime::config::RuntimeConfig& config);

} // namespace baton::factory

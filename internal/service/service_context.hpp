#pragma once

#include <memory>

namespace baton::core {
class Coordinator;
}
namespace baton::store {
class CoordinationStore;
}

namespace baton::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<baton::store::CoordinationStore> store;
  std::shared_ptr<baton::core::Coordinator>        coordinator;
};

} // namespace baton::service

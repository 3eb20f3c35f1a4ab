#pragma once

#include <memory>

namespace tender::core {
class TenderRegistry;
class OfferRegistry;
class EvaluationEngine;
class WinnerSelector;
}
namespace tender::access { class AccessControl; }
namespace tender::db { class Repository; }

namespace tender::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tender::core::TenderRegistry> tenders;
  std::shared_ptr<tender::core::OfferRegistry> offers;
  std::shared_ptr<tender::core::EvaluationEngine> evaluations;
  std::shared_ptr<tender::core::WinnerSelector> winners;
  std::shared_ptr<tender::access::AccessControl> access;
  std::shared_ptr<tender::db::Repository> repository;
};

}

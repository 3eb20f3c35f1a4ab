#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using tender::access::AccessControl;
using tender::access::Operation;

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

struct Harness {
  std::shared_ptr<tender::db::memory::MemoryRepository> repository;
  std::shared_ptr<AccessControl>                        access;
};

Harness BuildHarness(const std::string& authority = "authority", const std::vector<std::string>& evaluators = {"eval-1"}) {
  Harness h;
  h.repository = std::make_shared<tender::db::memory::MemoryRepository>();
  h.access     = std::make_shared<AccessControl>(h.repository, std::make_shared<tender::util::SystemTimeSource>());
  const bool bootstrapped = h.access->Bootstrap(authority, evaluators);
  assert(bootstrapped);
  (void)bootstrapped;
  return h;
}

void Authorize(Harness& h, const std::string& caller, Operation op) {
  auto tx = h.repository->Begin();
  h.access->Authorize(*tx, caller, op);
}

void TestBootstrapOnlyInitializesFreshStore() {
  auto h = BuildHarness("authority", {"eval-2", "eval-1", "eval-1", ""});
  assert(h.access->Authority() == "authority");

  // Duplicates and empty identities are skipped; the list is sorted.
  auto evaluators = h.access->ListEvaluators();
  assert(evaluators.size() == 2);
  assert(evaluators[0] == "eval-1");
  assert(evaluators[1] == "eval-2");

  // A second bootstrap leaves the persisted roles alone.
  assert(!h.access->Bootstrap("someone-else", {"eval-3"}));
  assert(h.access->Authority() == "authority");
  assert(!h.access->IsEvaluator("eval-3"));
}

void TestBootstrapRequiresAuthority() {
  auto access = std::make_shared<AccessControl>(std::make_shared<tender::db::memory::MemoryRepository>(),
                                                std::make_shared<tender::util::SystemTimeSource>());
  ExpectThrows<tender::util::InvalidInput>([&] { access->Bootstrap("", {"eval-1"}); });
}

void TestAuthorizationMatrix() {
  auto h = BuildHarness();

  Authorize(h, "authority", Operation::kCreateTender);
  Authorize(h, "authority", Operation::kCloseOfferPeriod);
  Authorize(h, "authority", Operation::kMarkAsEvaluated);
  Authorize(h, "authority", Operation::kCalculateWinner);
  Authorize(h, "eval-1", Operation::kEvaluateOffer);
  Authorize(h, "anyone", Operation::kSubmitOffer);

  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "eval-1", Operation::kCreateTender); });
  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "anyone", Operation::kCalculateWinner); });
  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "authority", Operation::kEvaluateOffer); });
  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "", Operation::kSubmitOffer); });
}

void TestEvaluatorManagement() {
  auto h = BuildHarness();

  ExpectThrows<tender::util::Unauthorized>([&] { h.access->AddEvaluator("eval-1", "eval-2"); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.access->AddEvaluator("authority", ""); });
  ExpectThrows<tender::util::AlreadyExists>([&] { h.access->AddEvaluator("authority", "eval-1"); });

  h.access->AddEvaluator("authority", "eval-2");
  assert(h.access->IsEvaluator("eval-2"));
  Authorize(h, "eval-2", Operation::kEvaluateOffer);

  h.access->RemoveEvaluator("authority", "eval-2");
  assert(!h.access->IsEvaluator("eval-2"));
  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "eval-2", Operation::kEvaluateOffer); });
  ExpectThrows<tender::util::NotFound>([&] { h.access->RemoveEvaluator("authority", "eval-2"); });

  // Removed evaluators can be added back.
  h.access->AddEvaluator("authority", "eval-2");
  assert(h.access->ListEvaluators().size() == 2);
}

void TestTransferAuthority() {
  auto h = BuildHarness();

  ExpectThrows<tender::util::Unauthorized>([&] { h.access->TransferAuthority("eval-1", "eval-1"); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.access->TransferAuthority("authority", ""); });

  h.access->TransferAuthority("authority", "successor");
  assert(h.access->Authority() == "successor");
  Authorize(h, "successor", Operation::kCreateTender);
  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "authority", Operation::kCreateTender); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.access->AddEvaluator("authority", "eval-2"); });
}

void TestRenounceAuthority() {
  auto h = BuildHarness();

  ExpectThrows<tender::util::Unauthorized>([&] { h.access->RenounceAuthority("eval-1"); });
  h.access->RenounceAuthority("authority");
  assert(h.access->Authority().empty());

  ExpectThrows<tender::util::Unauthorized>([&] { Authorize(h, "authority", Operation::kCreateTender); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.access->AddEvaluator("authority", "eval-2"); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.access->TransferAuthority("authority", "successor"); });

  // Evaluators keep working after the authority is gone.
  Authorize(h, "eval-1", Operation::kEvaluateOffer);

  // A renounced store is not fresh.
  assert(!h.access->Bootstrap("authority", {}));
  assert(h.access->Authority().empty());
}

} // namespace

int main() {
  TestBootstrapOnlyInitializesFreshStore();
  TestBootstrapRequiresAuthority();
  TestAuthorizationMatrix();
  TestEvaluatorManagement();
  TestTransferAuthority();
  TestRenounceAuthority();

  std::cout << "tender_manager_unit_access_control: pass\n";
  return 0;
}

#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "observe_rpc.hpp"

namespace tender::service {

using namespace tender::manager::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", 0, [&] {
    StatsResponse resp;
    auto          tx = ctx_.repository->Begin();

    for (const auto& record : ctx_.repository->ListTenders(*tx, 0, 0)) {
      switch (record.status) {
        case TENDER_STATUS_OPEN:
          resp.set_tenders_open(resp.tenders_open() + 1);
          break;
        case TENDER_STATUS_CLOSED:
          resp.set_tenders_closed(resp.tenders_closed() + 1);
          break;
        case TENDER_STATUS_EVALUATED:
          resp.set_tenders_evaluated(resp.tenders_evaluated() + 1);
          break;
        case TENDER_STATUS_FINALIZED:
          resp.set_tenders_finalized(resp.tenders_finalized() + 1);
          break;
        default:
          break;
      }
      resp.set_tenders_total(resp.tenders_total() + 1);
    }

    resp.set_offers_total(ctx_.repository->CountOffers(*tx));
    resp.set_evaluators(ctx_.repository->ListEvaluators(*tx).size());
    return resp;
  });
}

} // namespace tender::service

#pragma once

#include "buildq/v1.hpp"
#include "service_context.hpp"

namespace buildq::service {

class CallbackRetryService {
 public:
  explicit CallbackRetryService(ServiceContext ctx);

  buildq::v1::ScheduleRetryResponse ScheduleRetry(const buildq::v1::ScheduleRetryRequest& req);

  buildq::v1::ClaimReadyResponse ClaimReady(const buildq::v1::ClaimReadyRequest& req);

  buildq::v1::RescheduleResponse Reschedule(const buildq::v1::RescheduleRequest& req);

  void Abandon(const buildq::v1::AbandonRequest& req);

  buildq::v1::PendingCountResponse PendingCount();

 private:
  ServiceContext ctx_;
};

} // namespace buildq::service

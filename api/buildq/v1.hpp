#pragma once

#include "buildq/core/v1/job.pb.h"

#include "buildq/services/v1/build_queue_service.pb.h"
#include "buildq/services/v1/callback_retry_service.pb.h"
#include "buildq/services/v1/worker_service.pb.h"

#include "buildq/services/v1/build_queue_service.grpc.pb.h"
#include "buildq/services/v1/callback_retry_service.grpc.pb.h"
#include "buildq/services/v1/worker_service.grpc.pb.h"

namespace buildq::v1 {
using namespace ::buildq::core::v1;
using namespace ::buildq::services::v1;
}

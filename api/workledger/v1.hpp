#pragma once

#include "workledger/core/v1/types.pb.h"

#include "workledger/services/v1/job_queue_service.pb.h"
#include "workledger/services/v1/ledger_service.pb.h"

#include "workledger/services/v1/job_queue_service.grpc.pb.h"
#include "workledger/services/v1/ledger_service.grpc.pb.h"

namespace workledger::v1 {
using namespace ::workledger::core::v1;
using namespace ::workledger::services::v1;
}

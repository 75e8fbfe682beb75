#ifndef CONDUIT_COMMON_GRPC_STATUS_H
#define CONDUIT_COMMON_GRPC_STATUS_H

#include <grpcpp/impl/status.h>

#include <tempo_utils/status.h>

#include "transport_result.h"

namespace conduit_common {

    grpc::Status convert_status(const tempo_utils::Status &status);

    tempo_utils::Status convert_grpc_status(const grpc::Status &status);
}

#endif // CONDUIT_COMMON_GRPC_STATUS_H

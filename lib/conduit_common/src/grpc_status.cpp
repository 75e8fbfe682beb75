#include <conduit_common/grpc_status.h>

grpc::Status
conduit_common::convert_status(const tempo_utils::Status &status)
{
    if (status.isOk())
        return grpc::Status::OK;

    grpc::StatusCode code;

    switch (status.getStatusCode()) {
        case tempo_utils::StatusCode::kCancelled:
            code = grpc::StatusCode::CANCELLED;
            break;
        case tempo_utils::StatusCode::kInvalidArgument:
            code = grpc::StatusCode::INVALID_ARGUMENT;
            break;
        case tempo_utils::StatusCode::kDeadlineExceeded:
            code = grpc::StatusCode::DEADLINE_EXCEEDED;
            break;
        case tempo_utils::StatusCode::kNotFound:
            code = grpc::StatusCode::NOT_FOUND;
            break;
        case tempo_utils::StatusCode::kAlreadyExists:
            code = grpc::StatusCode::ALREADY_EXISTS;
            break;
        case tempo_utils::StatusCode::kPermissionDenied:
            code = grpc::StatusCode::PERMISSION_DENIED;
            break;
        case tempo_utils::StatusCode::kUnauthenticated:
            code = grpc::StatusCode::UNAUTHENTICATED;
            break;
        case tempo_utils::StatusCode::kResourceExhausted:
            code = grpc::StatusCode::RESOURCE_EXHAUSTED;
            break;
        case tempo_utils::StatusCode::kFailedPrecondition:
            code = grpc::StatusCode::FAILED_PRECONDITION;
            break;
        case tempo_utils::StatusCode::kAborted:
            code = grpc::StatusCode::ABORTED;
            break;
        case tempo_utils::StatusCode::kUnavailable:
            code = grpc::StatusCode::UNAVAILABLE;
            break;
        case tempo_utils::StatusCode::kOutOfRange:
            code = grpc::StatusCode::OUT_OF_RANGE;
            break;
        case tempo_utils::StatusCode::kUnimplemented:
            code = grpc::StatusCode::UNIMPLEMENTED;
            break;
        case tempo_utils::StatusCode::kInternal:
            code = grpc::StatusCode::INTERNAL;
            break;
        case tempo_utils::StatusCode::kUnknown:
        default:
            code = grpc::StatusCode::UNKNOWN;
            break;
    }

    auto message = status.getMessage();
    return grpc::Status(code, std::string(message));
}

tempo_utils::Status
conduit_common::convert_grpc_status(const grpc::Status &status)
{
    TransportCondition condition;

    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return {};
        case grpc::StatusCode::CANCELLED:
            condition = TransportCondition::kCancelled;
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
            condition = TransportCondition::kInvalidArgument;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            condition = TransportCondition::kDeadlineExceeded;
            break;
        case grpc::StatusCode::NOT_FOUND:
            condition = TransportCondition::kNotFound;
            break;
        case grpc::StatusCode::ALREADY_EXISTS:
            condition = TransportCondition::kAlreadyExists;
            break;
        case grpc::StatusCode::PERMISSION_DENIED:
            condition = TransportCondition::kPermissionDenied;
            break;
        case grpc::StatusCode::UNAUTHENTICATED:
            condition = TransportCondition::kUnauthenticated;
            break;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            condition = TransportCondition::kResourceExhausted;
            break;
        case grpc::StatusCode::FAILED_PRECONDITION:
            condition = TransportCondition::kFailedPrecondition;
            break;
        case grpc::StatusCode::ABORTED:
            condition = TransportCondition::kAborted;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            condition = TransportCondition::kUnavailable;
            break;
        case grpc::StatusCode::OUT_OF_RANGE:
            condition = TransportCondition::kOutOfRange;
            break;
        case grpc::StatusCode::UNIMPLEMENTED:
            condition = TransportCondition::kUnimplemented;
            break;
        case grpc::StatusCode::INTERNAL:
            condition = TransportCondition::kInternal;
            break;
        case grpc::StatusCode::UNKNOWN:
        default:
            condition = TransportCondition::kUnknown;
            break;
    }

    return TransportStatus::forCondition(condition, status.error_message());
}

#ifndef CONDUIT_COMMON_TRANSPORT_RESULT_H
#define CONDUIT_COMMON_TRANSPORT_RESULT_H

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include <tempo_utils/log_stream.h>
#include <tempo_utils/status.h>

namespace conduit_common {

    constexpr const char *kConduitTransportStatusNs("dev.conduit.ns:conduit-transport-status-1");

    /**
     * Conditions reported by a remote transport. There is one condition for each non-OK
     * transport status code so that a status received over the wire keeps its code.
     */
    enum class TransportCondition {
        kCancelled,
        kInvalidArgument,
        kDeadlineExceeded,
        kNotFound,
        kAlreadyExists,
        kPermissionDenied,
        kUnauthenticated,
        kResourceExhausted,
        kFailedPrecondition,
        kAborted,
        kUnavailable,
        kOutOfRange,
        kUnimplemented,
        kInternal,
        kUnknown,
    };

    class TransportStatus : public tempo_utils::TypedStatus<TransportCondition> {
    public:
        using TypedStatus::TypedStatus;
        static bool convert(TransportStatus &dstStatus, const tempo_utils::Status &srcStatus);

    private:
        TransportStatus(tempo_utils::StatusCode statusCode, std::shared_ptr<const tempo_utils::Detail> detail);

    public:
        /**
         *
         * @param condition
         * @param message
         * @return
         */
        static TransportStatus forCondition(
            TransportCondition condition,
            std::string_view message)
        {
            return TransportStatus(condition, message);
        }
        /**
         *
         * @tparam Args
         * @param condition
         * @param messageFmt
         * @param messageArgs
         * @return
         */
        template <typename... Args>
        static TransportStatus forCondition(
            TransportCondition condition,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return TransportStatus(condition, message);
        }
    };
}

namespace tempo_utils {

    template<>
    struct StatusTraits<conduit_common::TransportCondition> {
        using ConditionType = conduit_common::TransportCondition;
        static bool convert(conduit_common::TransportStatus &dstStatus, const tempo_utils::Status &srcStatus)
        {
            return conduit_common::TransportStatus::convert(dstStatus, srcStatus);
        }
    };

    template<>
    struct ConditionTraits<conduit_common::TransportCondition> {
        using StatusType = conduit_common::TransportStatus;
        static constexpr const char *condition_namespace() { return conduit_common::kConduitTransportStatusNs; }
        static constexpr StatusCode make_status_code(conduit_common::TransportCondition condition)
        {
            switch (condition) {
                case conduit_common::TransportCondition::kCancelled:
                    return tempo_utils::StatusCode::kCancelled;
                case conduit_common::TransportCondition::kInvalidArgument:
                    return tempo_utils::StatusCode::kInvalidArgument;
                case conduit_common::TransportCondition::kDeadlineExceeded:
                    return tempo_utils::StatusCode::kDeadlineExceeded;
                case conduit_common::TransportCondition::kNotFound:
                    return tempo_utils::StatusCode::kNotFound;
                case conduit_common::TransportCondition::kAlreadyExists:
                    return tempo_utils::StatusCode::kAlreadyExists;
                case conduit_common::TransportCondition::kPermissionDenied:
                    return tempo_utils::StatusCode::kPermissionDenied;
                case conduit_common::TransportCondition::kUnauthenticated:
                    return tempo_utils::StatusCode::kUnauthenticated;
                case conduit_common::TransportCondition::kResourceExhausted:
                    return tempo_utils::StatusCode::kResourceExhausted;
                case conduit_common::TransportCondition::kFailedPrecondition:
                    return tempo_utils::StatusCode::kFailedPrecondition;
                case conduit_common::TransportCondition::kAborted:
                    return tempo_utils::StatusCode::kAborted;
                case conduit_common::TransportCondition::kUnavailable:
                    return tempo_utils::StatusCode::kUnavailable;
                case conduit_common::TransportCondition::kOutOfRange:
                    return tempo_utils::StatusCode::kOutOfRange;
                case conduit_common::TransportCondition::kUnimplemented:
                    return tempo_utils::StatusCode::kUnimplemented;
                case conduit_common::TransportCondition::kInternal:
                    return tempo_utils::StatusCode::kInternal;
                default:
                    return tempo_utils::StatusCode::kUnknown;
            }
        };
        static constexpr const char *make_error_message(conduit_common::TransportCondition condition)
        {
            switch (condition) {
                case conduit_common::TransportCondition::kCancelled:
                    return "Cancelled";
                case conduit_common::TransportCondition::kInvalidArgument:
                    return "Invalid argument";
                case conduit_common::TransportCondition::kDeadlineExceeded:
                    return "Deadline exceeded";
                case conduit_common::TransportCondition::kNotFound:
                    return "Not found";
                case conduit_common::TransportCondition::kAlreadyExists:
                    return "Already exists";
                case conduit_common::TransportCondition::kPermissionDenied:
                    return "Permission denied";
                case conduit_common::TransportCondition::kUnauthenticated:
                    return "Unauthenticated";
                case conduit_common::TransportCondition::kResourceExhausted:
                    return "Resource exhausted";
                case conduit_common::TransportCondition::kFailedPrecondition:
                    return "Failed precondition";
                case conduit_common::TransportCondition::kAborted:
                    return "Aborted";
                case conduit_common::TransportCondition::kUnavailable:
                    return "Unavailable";
                case conduit_common::TransportCondition::kOutOfRange:
                    return "Out of range";
                case conduit_common::TransportCondition::kUnimplemented:
                    return "Unimplemented";
                case conduit_common::TransportCondition::kInternal:
                    return "Internal";
                case conduit_common::TransportCondition::kUnknown:
                    return "Unknown";
                default:
                    return "INVALID";
            }
        }
    };
}

#endif // CONDUIT_COMMON_TRANSPORT_RESULT_H

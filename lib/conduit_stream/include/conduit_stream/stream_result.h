#ifndef CONDUIT_STREAM_STREAM_RESULT_H
#define CONDUIT_STREAM_STREAM_RESULT_H

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include <tempo_utils/log_stream.h>
#include <tempo_utils/status.h>

namespace conduit_stream {

    constexpr const char *kConduitStreamStatusNs("dev.conduit.ns:conduit-stream-status-1");

    enum class StreamCondition {
        kInvalidArgument,
        kAlreadyClosed,
        kUnexpectedTermination,
    };


    class StreamStatus : public tempo_utils::TypedStatus<StreamCondition> {
    public:
        using TypedStatus::TypedStatus;
        static bool convert(StreamStatus &dstStatus, const tempo_utils::Status &srcStatus);

    private:
        StreamStatus(tempo_utils::StatusCode statusCode, std::shared_ptr<const tempo_utils::Detail> detail);

    public:
        /**
         *
         * @param condition
         * @param message
         * @return
         */
        static StreamStatus forCondition(
            StreamCondition condition,
            std::string_view message)
        {
            return StreamStatus(condition, message);
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
        static StreamStatus forCondition(
            StreamCondition condition,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return StreamStatus(condition, message);
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
        static StreamStatus forCondition(
            StreamCondition condition,
            tempo_utils::TraceId traceId,
            tempo_utils::SpanId spanId,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return StreamStatus(condition, message, traceId, spanId);
        }
    };
}

namespace tempo_utils {

    template<>
    struct StatusTraits<conduit_stream::StreamCondition> {
        using ConditionType = conduit_stream::StreamCondition;
        static bool convert(conduit_stream::StreamStatus &dstStatus, const tempo_utils::Status &srcStatus)
        {
            return conduit_stream::StreamStatus::convert(dstStatus, srcStatus);
        }
    };

    template<>
    struct ConditionTraits<conduit_stream::StreamCondition> {
        using StatusType = conduit_stream::StreamStatus;
        static constexpr const char *condition_namespace() { return conduit_stream::kConduitStreamStatusNs; }
        static constexpr StatusCode make_status_code(conduit_stream::StreamCondition condition)
        {
            switch (condition) {
                case conduit_stream::StreamCondition::kInvalidArgument:
                    return tempo_utils::StatusCode::kInvalidArgument;
                case conduit_stream::StreamCondition::kAlreadyClosed:
                    return tempo_utils::StatusCode::kFailedPrecondition;
                case conduit_stream::StreamCondition::kUnexpectedTermination:
                    return tempo_utils::StatusCode::kAborted;
                default:
                    return tempo_utils::StatusCode::kUnknown;
            }
        };
        static constexpr const char *make_error_message(conduit_stream::StreamCondition condition)
        {
            switch (condition) {
                case conduit_stream::StreamCondition::kInvalidArgument:
                    return "Invalid argument";
                case conduit_stream::StreamCondition::kAlreadyClosed:
                    return "Stream is closed";
                case conduit_stream::StreamCondition::kUnexpectedTermination:
                    return "Stream terminated unexpectedly";
                default:
                    return "INVALID";
            }
        }
    };
}

#endif // CONDUIT_STREAM_STREAM_RESULT_H
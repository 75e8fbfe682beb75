#ifndef CONDUIT_PLUGIN_PLUGIN_RESULT_H
#define CONDUIT_PLUGIN_PLUGIN_RESULT_H

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include <tempo_utils/log_stream.h>
#include <tempo_utils/status.h>

namespace conduit_plugin {

    constexpr const char *kConduitPluginStatusNs("dev.conduit.ns:conduit-plugin-status-1");

    enum class PluginCondition {
        kInvalidRequest,
        kMissingBucket,
        kMissingObject,
        kTransferAborted,
        kPluginInvariant,
    };


    class PluginStatus : public tempo_utils::TypedStatus<PluginCondition> {
    public:
        using TypedStatus::TypedStatus;
        static bool convert(PluginStatus &dstStatus, const tempo_utils::Status &srcStatus);

    private:
        PluginStatus(tempo_utils::StatusCode statusCode, std::shared_ptr<const tempo_utils::Detail> detail);

    public:
        /**
         *
         * @param condition
         * @param message
         * @return
         */
        static PluginStatus forCondition(
            PluginCondition condition,
            std::string_view message)
        {
            return PluginStatus(condition, message);
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
        static PluginStatus forCondition(
            PluginCondition condition,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return PluginStatus(condition, message);
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
        static PluginStatus forCondition(
            PluginCondition condition,
            tempo_utils::TraceId traceId,
            tempo_utils::SpanId spanId,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return PluginStatus(condition, message, traceId, spanId);
        }
    };
}

namespace tempo_utils {

    template<>
    struct StatusTraits<conduit_plugin::PluginCondition> {
        using ConditionType = conduit_plugin::PluginCondition;
        static bool convert(conduit_plugin::PluginStatus &dstStatus, const tempo_utils::Status &srcStatus)
        {
            return conduit_plugin::PluginStatus::convert(dstStatus, srcStatus);
        }
    };

    template<>
    struct ConditionTraits<conduit_plugin::PluginCondition> {
        using StatusType = conduit_plugin::PluginStatus;
        static constexpr const char *condition_namespace() { return conduit_plugin::kConduitPluginStatusNs; }
        static constexpr StatusCode make_status_code(conduit_plugin::PluginCondition condition)
        {
            switch (condition) {
                case conduit_plugin::PluginCondition::kInvalidRequest:
                    return tempo_utils::StatusCode::kInvalidArgument;
                case conduit_plugin::PluginCondition::kMissingBucket:
                    return tempo_utils::StatusCode::kNotFound;
                case conduit_plugin::PluginCondition::kMissingObject:
                    return tempo_utils::StatusCode::kNotFound;
                case conduit_plugin::PluginCondition::kTransferAborted:
                    return tempo_utils::StatusCode::kAborted;
                case conduit_plugin::PluginCondition::kPluginInvariant:
                    return tempo_utils::StatusCode::kInternal;
                default:
                    return tempo_utils::StatusCode::kUnknown;
            }
        };
        static constexpr const char *make_error_message(conduit_plugin::PluginCondition condition)
        {
            switch (condition) {
                case conduit_plugin::PluginCondition::kInvalidRequest:
                    return "Invalid request";
                case conduit_plugin::PluginCondition::kMissingBucket:
                    return "Missing bucket";
                case conduit_plugin::PluginCondition::kMissingObject:
                    return "Missing object";
                case conduit_plugin::PluginCondition::kTransferAborted:
                    return "Transfer aborted";
                case conduit_plugin::PluginCondition::kPluginInvariant:
                    return "Plugin invariant";
                default:
                    return "INVALID";
            }
        }
    };
}

#endif // CONDUIT_PLUGIN_PLUGIN_RESULT_H
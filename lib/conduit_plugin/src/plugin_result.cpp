
#include <conduit_plugin/plugin_result.h>

conduit_plugin::PluginStatus::PluginStatus(
    tempo_utils::StatusCode statusCode,
    std::shared_ptr<const tempo_utils::Detail> detail)
    : tempo_utils::TypedStatus<PluginCondition>(statusCode, detail)
{
}

bool
conduit_plugin::PluginStatus::convert(PluginStatus &dstStatus, const tempo_utils::Status &srcStatus)
{
    std::string_view srcNs = srcStatus.getErrorCategory();
    std::string_view dstNs = kConduitPluginStatusNs;
    if (srcNs != dstNs)
        return false;
    dstStatus = PluginStatus(srcStatus.getStatusCode(), srcStatus.getDetail());
    return true;
}

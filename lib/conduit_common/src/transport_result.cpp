
#include <conduit_common/transport_result.h>

conduit_common::TransportStatus::TransportStatus(
    tempo_utils::StatusCode statusCode,
    std::shared_ptr<const tempo_utils::Detail> detail)
    : tempo_utils::TypedStatus<TransportCondition>(statusCode, detail)
{
}

bool
conduit_common::TransportStatus::convert(TransportStatus &dstStatus, const tempo_utils::Status &srcStatus)
{
    std::string_view srcNs = srcStatus.getErrorCategory();
    std::string_view dstNs = kConduitTransportStatusNs;
    if (srcNs != dstNs)
        return false;
    dstStatus = TransportStatus(srcStatus.getStatusCode(), srcStatus.getDetail());
    return true;
}

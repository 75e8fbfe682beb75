
#include <conduit_stream/stream_result.h>

conduit_stream::StreamStatus::StreamStatus(
    tempo_utils::StatusCode statusCode,
    std::shared_ptr<const tempo_utils::Detail> detail)
    : tempo_utils::TypedStatus<StreamCondition>(statusCode, detail)
{
}

bool
conduit_stream::StreamStatus::convert(StreamStatus &dstStatus, const tempo_utils::Status &srcStatus)
{
    std::string_view srcNs = srcStatus.getErrorCategory();
    std::string_view dstNs = kConduitStreamStatusNs;
    if (srcNs != dstNs)
        return false;
    dstStatus = StreamStatus(srcStatus.getStatusCode(), srcStatus.getDetail());
    return true;
}

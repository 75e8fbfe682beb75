
#include <conduit_plugin/loopback_config.h>
#include <tempo_config/base_conversions.h>
#include <tempo_config/config_result.h>
#include <tempo_config/container_conversions.h>
#include <tempo_config/parse_config.h>

tempo_utils::Status
conduit_plugin::LoopbackConfigParser::convertValue(
    const tempo_config::ConfigNode &node,
    LoopbackConfig &loopbackConfig) const
{
    if (node.getNodeType() != tempo_config::ConfigNodeType::kMap)
        return tempo_config::ConfigStatus::forCondition(
            tempo_config::ConfigCondition::kWrongType, "loopback config must be a map");
    auto loopbackMap = node.toMap();

    tempo_config::IntegerParser downloadChunkSizeParser(kDefaultDownloadChunkSize);
    tempo_config::StringParser bucketParser;
    tempo_config::SeqTParser<std::string> bucketsParser(&bucketParser, {});

    int downloadChunkSize;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(downloadChunkSize,
        downloadChunkSizeParser, loopbackMap, "downloadChunkSize"));
    if (downloadChunkSize <= 0)
        return tempo_config::ConfigStatus::forCondition(
            tempo_config::ConfigCondition::kWrongType, "downloadChunkSize must be greater than zero");
    loopbackConfig.downloadChunkSize = static_cast<tu_uint32>(downloadChunkSize);

    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(loopbackConfig.buckets,
        bucketsParser, loopbackMap, "buckets"));

    return {};
}

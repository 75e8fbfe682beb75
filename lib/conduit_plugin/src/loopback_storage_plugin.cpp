
#include <algorithm>

#include <conduit_plugin/loopback_storage_plugin.h>
#include <conduit_plugin/plugin_result.h>
#include <tempo_utils/log_stream.h>

conduit_plugin::LoopbackStoragePlugin::LoopbackStoragePlugin(const LoopbackConfig &config)
    : m_config(config)
{
    TU_ASSERT (m_config.downloadChunkSize > 0);
    for (const auto &bucket : m_config.buckets) {
        m_buckets.try_emplace(bucket);
    }
}

tempo_utils::Status
conduit_plugin::LoopbackStoragePlugin::createBucket(const std::string &bucket)
{
    if (bucket.empty())
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "bucket name is empty");
    absl::MutexLock locker(&m_lock);
    m_buckets.try_emplace(bucket);
    return {};
}

bool
conduit_plugin::LoopbackStoragePlugin::hasBucket(const std::string &bucket) const
{
    absl::MutexLock locker(&m_lock);
    return m_buckets.contains(bucket);
}

bool
conduit_plugin::LoopbackStoragePlugin::hasObject(const std::string &bucket, const std::string &key) const
{
    return findObject(bucket, key).isResult();
}

tempo_utils::Result<tu_uint64>
conduit_plugin::LoopbackStoragePlugin::getObjectSize(const std::string &bucket, const std::string &key) const
{
    std::shared_ptr<const std::string> data;
    TU_ASSIGN_OR_RETURN (data, findObject(bucket, key));
    return static_cast<tu_uint64>(data->size());
}

tempo_utils::Result<std::shared_ptr<const std::string>>
conduit_plugin::LoopbackStoragePlugin::findObject(const std::string &bucket, const std::string &key) const
{
    absl::MutexLock locker(&m_lock);
    auto bucketEntry = m_buckets.find(bucket);
    if (bucketEntry == m_buckets.cend())
        return PluginStatus::forCondition(PluginCondition::kMissingBucket,
            "bucket '{}' does not exist", bucket);
    const auto &objects = bucketEntry->second;
    auto objectEntry = objects.find(key);
    if (objectEntry == objects.cend())
        return PluginStatus::forCondition(PluginCondition::kMissingObject,
            "object '{}' does not exist in bucket '{}'", key, bucket);
    return objectEntry->second;
}

tempo_utils::Status
conduit_plugin::LoopbackStoragePlugin::getObject(
    const conduit_storage::GetObjectRequest &request,
    grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> *writer)
{
    TU_ASSERT (writer != nullptr);

    if (request.bucket().empty())
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "missing bucket");
    if (request.key().empty())
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "missing key");

    std::shared_ptr<const std::string> data;
    TU_ASSIGN_OR_RETURN (data, findObject(request.bucket(), request.key()));

    conduit_storage::GetObjectResponse response;
    tu_uint64 offset = 0;
    while (offset < data->size()) {
        auto chunkSize = std::min<tu_uint64>(m_config.downloadChunkSize, data->size() - offset);
        response.set_file_chunk(data->substr(offset, chunkSize));
        if (!writer->Write(response))
            return PluginStatus::forCondition(PluginCondition::kTransferAborted,
                "download of '{}' was abandoned after {} bytes", request.key(), offset);
        offset += chunkSize;
    }

    TU_LOG_V << "sent object " << request.bucket() << "/" << request.key() << " (" << offset << " bytes)";
    return {};
}

tempo_utils::Status
conduit_plugin::LoopbackStoragePlugin::putObject(
    grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> *reader,
    conduit_storage::PutObjectResponse *response)
{
    TU_ASSERT (reader != nullptr);
    TU_ASSERT (response != nullptr);

    conduit_storage::PutObjectRequest request;
    if (!reader->Read(&request))
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "upload contained no requests");

    // the first request names the destination
    auto bucket = request.bucket();
    auto key = request.key();
    if (bucket.empty())
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "missing bucket");
    if (key.empty())
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "missing key");
    if (!hasBucket(bucket))
        return PluginStatus::forCondition(PluginCondition::kMissingBucket,
            "bucket '{}' does not exist", bucket);

    auto data = std::make_shared<std::string>(request.file_chunk());
    while (reader->Read(&request)) {
        data->append(request.file_chunk());
    }

    {
        absl::MutexLock locker(&m_lock);
        auto bucketEntry = m_buckets.find(bucket);
        if (bucketEntry == m_buckets.end())
            return PluginStatus::forCondition(PluginCondition::kMissingBucket,
                "bucket '{}' does not exist", bucket);
        bucketEntry->second[key] = data;
    }

    response->set_key(key);
    response->set_size(data->size());
    TU_LOG_V << "stored object " << bucket << "/" << key << " (" << data->size() << " bytes)";
    return {};
}


#include <algorithm>

#include <conduit_common/grpc_status.h>
#include <conduit_plugin/object_transfer.h>
#include <conduit_plugin/plugin_result.h>
#include <tempo_utils/log_stream.h>

tempo_utils::Result<std::string>
conduit_plugin::download_object(
    AbstractStorageClient *client,
    const std::string &bucket,
    const std::string &key)
{
    TU_ASSERT (client != nullptr);

    conduit_storage::GetObjectRequest request;
    request.set_bucket(bucket);
    request.set_key(key);

    grpc::ClientContext context;
    auto reader = client->getObject(&context, request);

    std::string data;
    conduit_storage::GetObjectResponse response;
    while (reader->Read(&response)) {
        data.append(response.file_chunk());
    }

    auto status = reader->Finish();
    if (!status.ok())
        return conduit_common::convert_grpc_status(status);

    TU_LOG_V << "downloaded " << bucket << "/" << key << " (" << data.size() << " bytes)";
    return data;
}

tempo_utils::Result<tu_uint64>
conduit_plugin::upload_object(
    AbstractStorageClient *client,
    const std::string &bucket,
    const std::string &key,
    std::string_view data,
    tu_uint32 chunkSize)
{
    TU_ASSERT (client != nullptr);
    if (chunkSize == 0)
        return PluginStatus::forCondition(PluginCondition::kInvalidRequest, "chunk size must be greater than zero");

    grpc::ClientContext context;
    conduit_storage::PutObjectResponse response;
    auto writer = client->putObject(&context, &response);

    conduit_storage::PutObjectRequest request;
    request.set_bucket(bucket);
    request.set_key(key);

    tu_uint64 offset = 0;
    do {
        auto size = std::min<tu_uint64>(chunkSize, data.size() - offset);
        request.set_file_chunk(std::string(data.substr(offset, size)));
        // a failed write means the plugin has ended the call, and Finish reports why
        if (!writer->Write(request))
            break;
        request.clear_bucket();
        request.clear_key();
        offset += size;
    } while (offset < data.size());

    if (!writer->WritesDone()) {
        TU_LOG_V << "upload of " << bucket << "/" << key << " ended before all requests were written";
    }

    auto status = writer->Finish();
    if (!status.ok())
        return conduit_common::convert_grpc_status(status);

    if (response.size() != data.size())
        return PluginStatus::forCondition(PluginCondition::kTransferAborted,
            "plugin stored {} bytes but {} bytes were sent", response.size(), data.size());

    TU_LOG_V << "uploaded " << bucket << "/" << key << " (" << response.size() << " bytes)";
    return response.size();
}


#include <conduit_common/grpc_status.h>
#include <conduit_plugin/storage_plugin_service.h>
#include <tempo_utils/log_stream.h>

conduit_plugin::StoragePluginService::StoragePluginService(std::shared_ptr<AbstractStoragePlugin> plugin)
    : m_plugin(std::move(plugin))
{
    TU_ASSERT (m_plugin != nullptr);
}

grpc::Status
conduit_plugin::StoragePluginService::GetObject(
    grpc::ServerContext *context,
    const conduit_storage::GetObjectRequest *request,
    grpc::ServerWriter<conduit_storage::GetObjectResponse> *writer)
{
    TU_LOG_V << "GetObject " << request->bucket() << "/" << request->key();
    auto status = m_plugin->getObject(*request, writer);
    TU_LOG_WARN_IF (status.notOk()) << "GetObject failed: " << status;
    return conduit_common::convert_status(status);
}

grpc::Status
conduit_plugin::StoragePluginService::PutObject(
    grpc::ServerContext *context,
    grpc::ServerReader<conduit_storage::PutObjectRequest> *reader,
    conduit_storage::PutObjectResponse *response)
{
    TU_LOG_V << "PutObject started";
    auto status = m_plugin->putObject(reader, response);
    TU_LOG_WARN_IF (status.notOk()) << "PutObject failed: " << status;
    return conduit_common::convert_status(status);
}

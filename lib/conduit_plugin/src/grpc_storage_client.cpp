
#include <conduit_plugin/grpc_storage_client.h>
#include <tempo_utils/log_stream.h>

conduit_plugin::GrpcStorageClient::GrpcStorageClient(std::shared_ptr<grpc::Channel> channel)
    : m_stub(conduit_storage::StoragePluginService::NewStub(channel))
{
    TU_ASSERT (m_stub != nullptr);
}

conduit_plugin::GrpcStorageClient::GrpcStorageClient(
    std::unique_ptr<conduit_storage::StoragePluginService::StubInterface> stub)
    : m_stub(std::move(stub))
{
    TU_ASSERT (m_stub != nullptr);
}

std::unique_ptr<grpc::ClientReaderInterface<conduit_storage::GetObjectResponse>>
conduit_plugin::GrpcStorageClient::getObject(
    grpc::ClientContext *context,
    const conduit_storage::GetObjectRequest &request)
{
    return m_stub->GetObject(context, request);
}

std::unique_ptr<grpc::ClientWriterInterface<conduit_storage::PutObjectRequest>>
conduit_plugin::GrpcStorageClient::putObject(
    grpc::ClientContext *context,
    conduit_storage::PutObjectResponse *response)
{
    return m_stub->PutObject(context, response);
}

#ifndef CONDUIT_PLUGIN_GRPC_STORAGE_CLIENT_H
#define CONDUIT_PLUGIN_GRPC_STORAGE_CLIENT_H

#include <grpcpp/channel.h>

#include "abstract_storage_client.h"

namespace conduit_plugin {

    class GrpcStorageClient : public AbstractStorageClient {
    public:
        explicit GrpcStorageClient(std::shared_ptr<grpc::Channel> channel);
        explicit GrpcStorageClient(std::unique_ptr<conduit_storage::StoragePluginService::StubInterface> stub);

        std::unique_ptr<grpc::ClientReaderInterface<conduit_storage::GetObjectResponse>> getObject(
            grpc::ClientContext *context,
            const conduit_storage::GetObjectRequest &request) override;

        std::unique_ptr<grpc::ClientWriterInterface<conduit_storage::PutObjectRequest>> putObject(
            grpc::ClientContext *context,
            conduit_storage::PutObjectResponse *response) override;

    private:
        std::unique_ptr<conduit_storage::StoragePluginService::StubInterface> m_stub;
    };
}

#endif // CONDUIT_PLUGIN_GRPC_STORAGE_CLIENT_H

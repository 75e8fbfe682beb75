#ifndef CONDUIT_PLUGIN_ABSTRACT_STORAGE_CLIENT_H
#define CONDUIT_PLUGIN_ABSTRACT_STORAGE_CLIENT_H

#include <memory>

#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <conduit_storage/storage_plugin.grpc.pb.h>

namespace conduit_plugin {

    /**
     * Host side view of a storage plugin. The returned streams behave like gRPC client
     * streams whether the plugin is reached over a channel or over loopback streams.
     */
    class AbstractStorageClient {
    public:
        virtual ~AbstractStorageClient() = default;

        virtual std::unique_ptr<grpc::ClientReaderInterface<conduit_storage::GetObjectResponse>> getObject(
            grpc::ClientContext *context,
            const conduit_storage::GetObjectRequest &request) = 0;

        virtual std::unique_ptr<grpc::ClientWriterInterface<conduit_storage::PutObjectRequest>> putObject(
            grpc::ClientContext *context,
            conduit_storage::PutObjectResponse *response) = 0;
    };
}

#endif // CONDUIT_PLUGIN_ABSTRACT_STORAGE_CLIENT_H

#ifndef CONDUIT_PLUGIN_ABSTRACT_STORAGE_PLUGIN_H
#define CONDUIT_PLUGIN_ABSTRACT_STORAGE_PLUGIN_H

#include <grpcpp/support/sync_stream.h>

#include <conduit_storage/storage_plugin.grpc.pb.h>
#include <tempo_utils/status.h>

namespace conduit_plugin {

    /**
     * A storage backend. Handlers are written against the gRPC stream interfaces so the same
     * plugin can be served over a real gRPC server or over loopback streams. A handler which
     * returns an error status fails the call with that error.
     */
    class AbstractStoragePlugin {
    public:
        virtual ~AbstractStoragePlugin() = default;

        virtual tempo_utils::Status getObject(
            const conduit_storage::GetObjectRequest &request,
            grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> *writer) = 0;

        virtual tempo_utils::Status putObject(
            grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> *reader,
            conduit_storage::PutObjectResponse *response) = 0;
    };
}

#endif // CONDUIT_PLUGIN_ABSTRACT_STORAGE_PLUGIN_H

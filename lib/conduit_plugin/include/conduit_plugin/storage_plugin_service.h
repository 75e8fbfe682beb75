#ifndef CONDUIT_PLUGIN_STORAGE_PLUGIN_SERVICE_H
#define CONDUIT_PLUGIN_STORAGE_PLUGIN_SERVICE_H

#include <memory>

#include <conduit_storage/storage_plugin.grpc.pb.h>

#include "abstract_storage_plugin.h"

namespace conduit_plugin {

    /**
     * gRPC service implementing the StoragePluginService service definition by forwarding
     * each call to a storage plugin.
     */
    class StoragePluginService : public conduit_storage::StoragePluginService::Service {
    public:
        explicit StoragePluginService(std::shared_ptr<AbstractStoragePlugin> plugin);

        grpc::Status GetObject(
            grpc::ServerContext *context,
            const conduit_storage::GetObjectRequest *request,
            grpc::ServerWriter<conduit_storage::GetObjectResponse> *writer) override;

        grpc::Status PutObject(
            grpc::ServerContext *context,
            grpc::ServerReader<conduit_storage::PutObjectRequest> *reader,
            conduit_storage::PutObjectResponse *response) override;

    private:
        std::shared_ptr<AbstractStoragePlugin> m_plugin;
    };
}

#endif // CONDUIT_PLUGIN_STORAGE_PLUGIN_SERVICE_H

#ifndef CONDUIT_PLUGIN_LOOPBACK_STORAGE_CLIENT_H
#define CONDUIT_PLUGIN_LOOPBACK_STORAGE_CLIENT_H

#include <memory>
#include <vector>

#include <absl/synchronization/mutex.h>

#include <tempo_utils/status.h>

#include "abstract_storage_client.h"
#include "abstract_storage_plugin.h"

namespace conduit_plugin {

    class LoopbackHandlerCall;

    /**
     * Calls a storage plugin in the same process without a gRPC transport. Each call connects
     * a fresh stream pair, runs the plugin handler on a thread of its own and hands the client
     * end back to the caller. When the handler returns, its status completes the call: an ok
     * status finishes a download or delivers the upload response, and an error is delivered
     * as a carried error.
     *
     * Handler threads are joined when the client is destroyed, so every stream returned by
     * the client must be destroyed before the client itself.
     */
    class LoopbackStorageClient : public AbstractStorageClient {
    public:
        explicit LoopbackStorageClient(std::shared_ptr<AbstractStoragePlugin> plugin);
        ~LoopbackStorageClient() override;

        std::unique_ptr<grpc::ClientReaderInterface<conduit_storage::GetObjectResponse>> getObject(
            grpc::ClientContext *context,
            const conduit_storage::GetObjectRequest &request) override;

        std::unique_ptr<grpc::ClientWriterInterface<conduit_storage::PutObjectRequest>> putObject(
            grpc::ClientContext *context,
            conduit_storage::PutObjectResponse *response) override;

        int numRunningCalls() const;

    private:
        std::shared_ptr<AbstractStoragePlugin> m_plugin;

        mutable absl::Mutex m_lock;
        std::vector<std::unique_ptr<LoopbackHandlerCall>> m_calls ABSL_GUARDED_BY(m_lock);

        tempo_utils::Status startCall(std::unique_ptr<LoopbackHandlerCall> call);
    };
}

#endif // CONDUIT_PLUGIN_LOOPBACK_STORAGE_CLIENT_H

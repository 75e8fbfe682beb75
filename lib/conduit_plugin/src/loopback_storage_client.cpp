
#include <atomic>

#include <uv.h>

#include <conduit_plugin/loopback_storage_client.h>
#include <conduit_plugin/loopback_stream_adapters.h>
#include <conduit_plugin/plugin_result.h>
#include <tempo_utils/log_stream.h>

namespace conduit_plugin {

    /**
     * A plugin handler invocation running on its own thread.
     */
    class LoopbackHandlerCall {
    public:
        explicit LoopbackHandlerCall(std::shared_ptr<AbstractStoragePlugin> plugin)
            : m_plugin(std::move(plugin)),
              m_finished(false)
        {
        }
        virtual ~LoopbackHandlerCall() = default;

        uv_thread_t tid;

        bool isFinished() const { return m_finished.load(); }

        static void run(void *ptr)
        {
            auto *call = static_cast<LoopbackHandlerCall *>(ptr);
            call->handle();
            call->m_finished.store(true);
        }

    protected:
        std::shared_ptr<AbstractStoragePlugin> m_plugin;
        virtual void handle() = 0;

    private:
        std::atomic<bool> m_finished;
    };

    class GetObjectCall : public LoopbackHandlerCall {
    public:
        GetObjectCall(
            std::shared_ptr<AbstractStoragePlugin> plugin,
            const conduit_storage::GetObjectRequest &request,
            std::unique_ptr<ObjectDownloadServer> server)
            : LoopbackHandlerCall(std::move(plugin)),
              m_request(request),
              m_server(std::move(server))
        {
        }

    protected:
        void handle() override
        {
            LoopbackObjectWriter writer(m_server.get());
            auto status = m_plugin->getObject(m_request, &writer);
            if (status.isOk()) {
                auto finishStatus = m_server->finish();
                if (finishStatus.notOk()) {
                    TU_LOG_V << "GetObject was closed by the client before it finished";
                }
                return;
            }
            auto sendStatus = m_server->sendError(status);
            if (sendStatus.notOk()) {
                TU_LOG_V << "GetObject failed after the client went away: " << status;
            }
        }

    private:
        conduit_storage::GetObjectRequest m_request;
        std::unique_ptr<ObjectDownloadServer> m_server;
    };

    class PutObjectCall : public LoopbackHandlerCall {
    public:
        PutObjectCall(
            std::shared_ptr<AbstractStoragePlugin> plugin,
            std::unique_ptr<ObjectUploadServer> server)
            : LoopbackHandlerCall(std::move(plugin)),
              m_server(std::move(server))
        {
        }

    protected:
        void handle() override
        {
            LoopbackUploadReader reader(m_server.get());
            conduit_storage::PutObjectResponse response;
            auto status = m_plugin->putObject(&reader, &response);

            // release a client still blocked writing requests the handler did not read
            m_server->closeRequests();

            tempo_utils::Status completeStatus;
            if (status.isOk()) {
                completeStatus = m_server->completeWithResult(
                    std::make_shared<const conduit_storage::PutObjectResponse>(std::move(response)));
            } else {
                completeStatus = m_server->completeWithError(status);
            }
            if (completeStatus.notOk()) {
                TU_LOG_V << "PutObject completed after the client went away: " << completeStatus;
            }
        }

    private:
        std::unique_ptr<ObjectUploadServer> m_server;
    };
}

conduit_plugin::LoopbackStorageClient::LoopbackStorageClient(std::shared_ptr<AbstractStoragePlugin> plugin)
    : m_plugin(std::move(plugin))
{
    TU_ASSERT (m_plugin != nullptr);
}

conduit_plugin::LoopbackStorageClient::~LoopbackStorageClient()
{
    absl::MutexLock locker(&m_lock);
    for (auto &call : m_calls) {
        uv_thread_join(&call->tid);
    }
    m_calls.clear();
}

std::unique_ptr<grpc::ClientReaderInterface<conduit_storage::GetObjectResponse>>
conduit_plugin::LoopbackStorageClient::getObject(
    grpc::ClientContext *context,
    const conduit_storage::GetObjectRequest &request)
{
    auto endpoints = conduit_stream::open_download_stream<conduit_storage::GetObjectResponse>();
    auto call = std::make_unique<GetObjectCall>(m_plugin, request, std::move(endpoints.server));
    TU_RAISE_IF_NOT_OK (startCall(std::move(call)));
    return std::make_unique<LoopbackObjectReader>(std::move(endpoints.client));
}

std::unique_ptr<grpc::ClientWriterInterface<conduit_storage::PutObjectRequest>>
conduit_plugin::LoopbackStorageClient::putObject(
    grpc::ClientContext *context,
    conduit_storage::PutObjectResponse *response)
{
    auto endpoints = conduit_stream::open_upload_stream<
        conduit_storage::PutObjectRequest,
        conduit_storage::PutObjectResponse>();
    auto call = std::make_unique<PutObjectCall>(m_plugin, std::move(endpoints.server));
    TU_RAISE_IF_NOT_OK (startCall(std::move(call)));
    return std::make_unique<LoopbackUploadWriter>(std::move(endpoints.client), response);
}

int
conduit_plugin::LoopbackStorageClient::numRunningCalls() const
{
    absl::MutexLock locker(&m_lock);
    int running = 0;
    for (const auto &call : m_calls) {
        if (!call->isFinished()) {
            running++;
        }
    }
    return running;
}

tempo_utils::Status
conduit_plugin::LoopbackStorageClient::startCall(std::unique_ptr<LoopbackHandlerCall> call)
{
    absl::MutexLock locker(&m_lock);

    // join the threads of calls which have already completed
    for (auto it = m_calls.begin(); it != m_calls.end();) {
        if ((*it)->isFinished()) {
            uv_thread_join(&(*it)->tid);
            it = m_calls.erase(it);
        } else {
            it++;
        }
    }

    auto ret = uv_thread_create(&call->tid, LoopbackHandlerCall::run, call.get());
    if (ret != 0)
        return PluginStatus::forCondition(PluginCondition::kPluginInvariant,
            "failed to start handler thread: {}", uv_strerror(ret));
    m_calls.push_back(std::move(call));
    return {};
}

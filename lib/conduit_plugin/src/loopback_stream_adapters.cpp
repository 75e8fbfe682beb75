
#include <limits>

#include <conduit_common/grpc_status.h>
#include <conduit_plugin/loopback_stream_adapters.h>
#include <tempo_utils/log_stream.h>

conduit_plugin::LoopbackObjectReader::LoopbackObjectReader(std::unique_ptr<ObjectDownloadClient> client)
    : m_client(std::move(client)),
      m_done(false)
{
    TU_ASSERT (m_client != nullptr);
}

conduit_plugin::LoopbackObjectReader::~LoopbackObjectReader()
{
    auto status = m_client->halfClose();
    if (status.isOk()) {
        TU_LOG_V << "object reader abandoned download before end of stream";
    }
}

void
conduit_plugin::LoopbackObjectReader::WaitForInitialMetadata()
{
}

bool
conduit_plugin::LoopbackObjectReader::NextMessageSize(uint32_t *sz)
{
    *sz = std::numeric_limits<uint32_t>::max();
    return !m_done;
}

bool
conduit_plugin::LoopbackObjectReader::Read(conduit_storage::GetObjectResponse *msg)
{
    if (m_done)
        return false;

    auto message = m_client->receive();
    switch (message.getType()) {
        case conduit_stream::MessageType::Payload:
            *msg = *message.getPayload();
            return true;
        case conduit_stream::MessageType::Error:
            m_status = conduit_common::convert_status(message.getError());
            break;
        default:
            break;
    }

    m_done = true;
    return false;
}

grpc::Status
conduit_plugin::LoopbackObjectReader::Finish()
{
    if (!m_done) {
        // the download is still in progress, so finishing now cancels it
        auto status = m_client->halfClose();
        if (status.isOk()) {
            m_status = grpc::Status(grpc::StatusCode::CANCELLED, "download was abandoned before completion");
        }
        m_done = true;
    }
    return m_status;
}

conduit_plugin::LoopbackObjectWriter::LoopbackObjectWriter(ObjectDownloadServer *server)
    : m_server(server)
{
    TU_ASSERT (m_server != nullptr);
}

void
conduit_plugin::LoopbackObjectWriter::SendInitialMetadata()
{
    auto status = m_server->sendHeader({});
    TU_LOG_WARN_IF (status.notOk()) << "failed to send initial metadata: " << status;
}

bool
conduit_plugin::LoopbackObjectWriter::Write(
    const conduit_storage::GetObjectResponse &msg,
    grpc::WriteOptions options)
{
    auto status = m_server->send(std::make_shared<const conduit_storage::GetObjectResponse>(msg));
    if (status.notOk()) {
        TU_LOG_V << "failed to write object chunk: " << status;
        return false;
    }
    return true;
}

conduit_plugin::LoopbackUploadWriter::LoopbackUploadWriter(
    std::unique_ptr<ObjectUploadClient> client,
    conduit_storage::PutObjectResponse *response)
    : m_client(std::move(client)),
      m_response(response),
      m_done(false)
{
    TU_ASSERT (m_client != nullptr);
    TU_ASSERT (m_response != nullptr);
}

conduit_plugin::LoopbackUploadWriter::~LoopbackUploadWriter()
{
    m_client->cancel();
}

bool
conduit_plugin::LoopbackUploadWriter::Write(
    const conduit_storage::PutObjectRequest &msg,
    grpc::WriteOptions options)
{
    auto status = m_client->send(std::make_shared<const conduit_storage::PutObjectRequest>(msg));
    if (status.notOk()) {
        TU_LOG_V << "failed to write upload request: " << status;
        return false;
    }
    if (options.is_last_message())
        return WritesDone();
    return true;
}

bool
conduit_plugin::LoopbackUploadWriter::WritesDone()
{
    auto status = m_client->halfClose();
    if (status.notOk()) {
        TU_LOG_V << "failed to close upload requests: " << status;
        return false;
    }
    return true;
}

/**
 * Wait for the plugin to complete the upload. An upload always ends with exactly one
 * response or error; if the response half closes without either, the upload is reported
 * as aborted.
 */
grpc::Status
conduit_plugin::LoopbackUploadWriter::Finish()
{
    if (m_done)
        return m_status;
    m_done = true;

    auto message = m_client->awaitResult();
    switch (message.getType()) {
        case conduit_stream::MessageType::Payload:
            m_response->CopyFrom(*message.getPayload());
            m_status = grpc::Status::OK;
            break;
        case conduit_stream::MessageType::Error:
            m_status = conduit_common::convert_status(message.getError());
            break;
        default: {
            auto status = conduit_stream::StreamStatus::forCondition(
                conduit_stream::StreamCondition::kUnexpectedTermination, "upload ended without a response");
            TU_LOG_WARN << status;
            m_status = conduit_common::convert_status(status);
            break;
        }
    }

    return m_status;
}

conduit_plugin::LoopbackUploadReader::LoopbackUploadReader(ObjectUploadServer *server)
    : m_server(server)
{
    TU_ASSERT (m_server != nullptr);
}

void
conduit_plugin::LoopbackUploadReader::SendInitialMetadata()
{
    auto status = m_server->sendHeader({});
    TU_LOG_WARN_IF (status.notOk()) << "failed to send initial metadata: " << status;
}

bool
conduit_plugin::LoopbackUploadReader::NextMessageSize(uint32_t *sz)
{
    *sz = std::numeric_limits<uint32_t>::max();
    return !m_server->isRequestsClosed();
}

bool
conduit_plugin::LoopbackUploadReader::Read(conduit_storage::PutObjectRequest *msg)
{
    auto message = m_server->receive();
    if (!message.hasPayload())
        return false;
    *msg = *message.getPayload();
    return true;
}

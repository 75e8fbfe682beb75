#ifndef CONDUIT_STREAM_UPLOAD_STREAM_H
#define CONDUIT_STREAM_UPLOAD_STREAM_H

#include <memory>

#include <tempo_utils/log_stream.h>
#include <tempo_utils/status.h>

#include "call_scope.h"
#include "handoff_channel.h"
#include "stream_guard.h"
#include "stream_message.h"
#include "stream_result.h"

namespace conduit_stream {

    /**
     * Shared state of a client streaming call. Requests flow from the client to the server
     * and a single response flows back. Each half has its own channel and its own guard,
     * so either half can be closed while the other stays open.
     *
     * @tparam RequestType
     * @tparam ResponseType
     */
    template<class RequestType, class ResponseType>
    class UploadStream {
    public:
        UploadStream();

        bool isRequestsClosed() const;
        bool closeRequests();
        bool isResponsesClosed() const;
        bool closeResponses();

        HandoffChannel<StreamMessage<RequestType>> *getRequests();
        HandoffChannel<StreamMessage<ResponseType>> *getResponses();

    private:
        HandoffChannel<StreamMessage<RequestType>> m_requests;
        StreamGuard m_requestsGuard;
        HandoffChannel<StreamMessage<ResponseType>> m_responses;
        StreamGuard m_responsesGuard;
    };

    /**
     * The client endpoint of an upload. The client sends request chunks, then waits for the
     * single terminal response.
     *
     * @tparam RequestType
     * @tparam ResponseType
     */
    template<class RequestType, class ResponseType>
    class UploadClient {
    public:
        explicit UploadClient(std::shared_ptr<UploadStream<RequestType,ResponseType>> stream);

        bool isClosed() const;
        tempo_utils::Status send(std::shared_ptr<const RequestType> payload);
        tempo_utils::Status halfClose();
        StreamMessage<ResponseType> awaitResult();
        void cancel();

        tempo_utils::Status sendMessage(const StreamMessage<RequestType> &message);
        StreamMessage<ResponseType> receiveMessage();
        Metadata header() const;
        Metadata trailer() const;
        CallScope scope() const;

    private:
        std::shared_ptr<UploadStream<RequestType,ResponseType>> m_stream;
    };

    /**
     * The server endpoint of an upload. The server reads request chunks until the end of the
     * request half, then completes the call with exactly one result or error.
     *
     * @tparam RequestType
     * @tparam ResponseType
     */
    template<class RequestType, class ResponseType>
    class UploadServer {
    public:
        explicit UploadServer(std::shared_ptr<UploadStream<RequestType,ResponseType>> stream);

        bool isClosed() const;
        bool isRequestsClosed() const;
        StreamMessage<RequestType> receive();
        tempo_utils::Status completeWithResult(std::shared_ptr<const ResponseType> payload);
        tempo_utils::Status completeWithError(const tempo_utils::Status &error);
        void closeRequests();
        void abandon();

        tempo_utils::Status sendMessage(const StreamMessage<ResponseType> &message);
        StreamMessage<RequestType> receiveMessage();
        tempo_utils::Status setHeader(const Metadata &metadata);
        tempo_utils::Status sendHeader(const Metadata &metadata);
        void setTrailer(const Metadata &metadata);
        CallScope scope() const;

    private:
        std::shared_ptr<UploadStream<RequestType,ResponseType>> m_stream;
    };

    template<class RequestType, class ResponseType>
    UploadStream<RequestType,ResponseType>::UploadStream()
        : m_requestsGuard(&m_requests),
          m_responsesGuard(&m_responses)
    {
    }

    template<class RequestType, class ResponseType>
    bool
    UploadStream<RequestType,ResponseType>::isRequestsClosed() const
    {
        return m_requestsGuard.isClosed();
    }

    template<class RequestType, class ResponseType>
    bool
    UploadStream<RequestType,ResponseType>::closeRequests()
    {
        return m_requestsGuard.close();
    }

    template<class RequestType, class ResponseType>
    bool
    UploadStream<RequestType,ResponseType>::isResponsesClosed() const
    {
        return m_responsesGuard.isClosed();
    }

    template<class RequestType, class ResponseType>
    bool
    UploadStream<RequestType,ResponseType>::closeResponses()
    {
        return m_responsesGuard.close();
    }

    template<class RequestType, class ResponseType>
    HandoffChannel<StreamMessage<RequestType>> *
    UploadStream<RequestType,ResponseType>::getRequests()
    {
        return &m_requests;
    }

    template<class RequestType, class ResponseType>
    HandoffChannel<StreamMessage<ResponseType>> *
    UploadStream<RequestType,ResponseType>::getResponses()
    {
        return &m_responses;
    }

    template<class RequestType, class ResponseType>
    UploadClient<RequestType,ResponseType>::UploadClient(
        std::shared_ptr<UploadStream<RequestType,ResponseType>> stream)
        : m_stream(std::move(stream))
    {
        TU_ASSERT (m_stream != nullptr);
    }

    template<class RequestType, class ResponseType>
    bool
    UploadClient<RequestType,ResponseType>::isClosed() const
    {
        return m_stream->isRequestsClosed();
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadClient<RequestType,ResponseType>::send(std::shared_ptr<const RequestType> payload)
    {
        if (payload == nullptr)
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "request payload cannot be nil");
        if (m_stream->isRequestsClosed())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        return m_stream->getRequests()->send(StreamMessage<RequestType>::forPayload(std::move(payload)));
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadClient<RequestType,ResponseType>::halfClose()
    {
        if (!m_stream->closeRequests())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        return {};
    }

    /**
     * Signal that no more requests will be sent, then block until the server completes the
     * call. If the response half is closed without a terminal message the end-of-stream
     * message is returned, which the caller must treat as an unexpected termination.
     */
    template<class RequestType, class ResponseType>
    StreamMessage<ResponseType>
    UploadClient<RequestType,ResponseType>::awaitResult()
    {
        m_stream->closeRequests();
        StreamMessage<ResponseType> message;
        if (!m_stream->getResponses()->receive(message)) {
            TU_LOG_V << "upload response half closed without a result";
            return {};
        }
        return message;
    }

    template<class RequestType, class ResponseType>
    void
    UploadClient<RequestType,ResponseType>::cancel()
    {
        auto requestsClosed = m_stream->closeRequests();
        auto responsesClosed = m_stream->closeResponses();
        if (requestsClosed || responsesClosed) {
            TU_LOG_V << "client cancelled upload stream";
        }
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadClient<RequestType,ResponseType>::sendMessage(const StreamMessage<RequestType> &message)
    {
        if (!message.hasPayload())
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "message must carry a request payload");
        return send(message.getPayload());
    }

    template<class RequestType, class ResponseType>
    StreamMessage<ResponseType>
    UploadClient<RequestType,ResponseType>::receiveMessage()
    {
        return awaitResult();
    }

    template<class RequestType, class ResponseType>
    Metadata
    UploadClient<RequestType,ResponseType>::header() const
    {
        return {};
    }

    template<class RequestType, class ResponseType>
    Metadata
    UploadClient<RequestType,ResponseType>::trailer() const
    {
        return {};
    }

    template<class RequestType, class ResponseType>
    CallScope
    UploadClient<RequestType,ResponseType>::scope() const
    {
        return CallScope::background();
    }

    template<class RequestType, class ResponseType>
    UploadServer<RequestType,ResponseType>::UploadServer(
        std::shared_ptr<UploadStream<RequestType,ResponseType>> stream)
        : m_stream(std::move(stream))
    {
        TU_ASSERT (m_stream != nullptr);
    }

    template<class RequestType, class ResponseType>
    bool
    UploadServer<RequestType,ResponseType>::isClosed() const
    {
        return m_stream->isResponsesClosed();
    }

    template<class RequestType, class ResponseType>
    bool
    UploadServer<RequestType,ResponseType>::isRequestsClosed() const
    {
        return m_stream->isRequestsClosed();
    }

    template<class RequestType, class ResponseType>
    StreamMessage<RequestType>
    UploadServer<RequestType,ResponseType>::receive()
    {
        StreamMessage<RequestType> message;
        if (!m_stream->getRequests()->receive(message))
            return {};
        return message;
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadServer<RequestType,ResponseType>::completeWithResult(std::shared_ptr<const ResponseType> payload)
    {
        if (payload == nullptr)
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "response payload cannot be nil");
        if (m_stream->isResponsesClosed())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        auto status = m_stream->getResponses()->send(
            StreamMessage<ResponseType>::forPayload(std::move(payload)));
        m_stream->closeResponses();
        return status;
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadServer<RequestType,ResponseType>::completeWithError(const tempo_utils::Status &error)
    {
        if (error.isOk())
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "terminal error must not be ok");
        if (m_stream->isResponsesClosed())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        auto status = m_stream->getResponses()->send(StreamMessage<ResponseType>::forError(error));
        m_stream->closeResponses();
        return status;
    }

    /**
     * Stop accepting requests. A client blocked sending a request is released with
     * kAlreadyClosed.
     */
    template<class RequestType, class ResponseType>
    void
    UploadServer<RequestType,ResponseType>::closeRequests()
    {
        m_stream->closeRequests();
    }

    /**
     * Close the response half without a terminal message.
     */
    template<class RequestType, class ResponseType>
    void
    UploadServer<RequestType,ResponseType>::abandon()
    {
        if (m_stream->closeResponses()) {
            TU_LOG_WARN << "server abandoned upload stream without a result";
        }
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadServer<RequestType,ResponseType>::sendMessage(const StreamMessage<ResponseType> &message)
    {
        switch (message.getType()) {
            case MessageType::Payload:
                return completeWithResult(message.getPayload());
            case MessageType::Error:
                return completeWithError(message.getError());
            default:
                return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                    "message must carry a payload or an error");
        }
    }

    template<class RequestType, class ResponseType>
    StreamMessage<RequestType>
    UploadServer<RequestType,ResponseType>::receiveMessage()
    {
        return receive();
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadServer<RequestType,ResponseType>::setHeader(const Metadata &metadata)
    {
        return {};
    }

    template<class RequestType, class ResponseType>
    tempo_utils::Status
    UploadServer<RequestType,ResponseType>::sendHeader(const Metadata &metadata)
    {
        return {};
    }

    template<class RequestType, class ResponseType>
    void
    UploadServer<RequestType,ResponseType>::setTrailer(const Metadata &metadata)
    {
    }

    template<class RequestType, class ResponseType>
    CallScope
    UploadServer<RequestType,ResponseType>::scope() const
    {
        return CallScope::background();
    }

    /**
     * A connected upload client and server sharing one UploadStream.
     */
    template<class RequestType, class ResponseType>
    struct UploadEndpoints {
        std::unique_ptr<UploadClient<RequestType,ResponseType>> client;
        std::unique_ptr<UploadServer<RequestType,ResponseType>> server;
    };

    template<class RequestType, class ResponseType>
    UploadEndpoints<RequestType,ResponseType>
    open_upload_stream()
    {
        auto stream = std::make_shared<UploadStream<RequestType,ResponseType>>();
        UploadEndpoints<RequestType,ResponseType> endpoints;
        endpoints.client = std::make_unique<UploadClient<RequestType,ResponseType>>(stream);
        endpoints.server = std::make_unique<UploadServer<RequestType,ResponseType>>(stream);
        return endpoints;
    }
}

#endif // CONDUIT_STREAM_UPLOAD_STREAM_H

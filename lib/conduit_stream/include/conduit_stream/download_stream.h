#ifndef CONDUIT_STREAM_DOWNLOAD_STREAM_H
#define CONDUIT_STREAM_DOWNLOAD_STREAM_H

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
     * Shared state of a server streaming call: a single channel of response messages flowing
     * from the server to the client, and the guard which closes it. The state is shared by the
     * DownloadClient and DownloadServer constructed over it and lives as long as either of them.
     *
     * @tparam ResponseType
     */
    template<class ResponseType>
    class DownloadStream {
    public:
        DownloadStream();

        bool isClosed() const;
        bool close();

        HandoffChannel<StreamMessage<ResponseType>> *getMessages();

    private:
        HandoffChannel<StreamMessage<ResponseType>> m_messages;
        StreamGuard m_guard;
    };

    /**
     * The client endpoint of a download. The client pulls response messages and may close
     * the stream early to abandon the download.
     *
     * @tparam ResponseType
     */
    template<class ResponseType>
    class DownloadClient {
    public:
        explicit DownloadClient(std::shared_ptr<DownloadStream<ResponseType>> stream);

        bool isClosed() const;
        StreamMessage<ResponseType> receive();
        tempo_utils::Status halfClose();

        StreamMessage<ResponseType> receiveMessage();
        Metadata header() const;
        Metadata trailer() const;
        CallScope scope() const;

    private:
        std::shared_ptr<DownloadStream<ResponseType>> m_stream;
    };

    /**
     * The server endpoint of a download. The server pushes response messages one at a time,
     * each send blocking until the client has received it, and ends the download either by
     * finishing cleanly or by sending a terminal error.
     *
     * @tparam ResponseType
     */
    template<class ResponseType>
    class DownloadServer {
    public:
        explicit DownloadServer(std::shared_ptr<DownloadStream<ResponseType>> stream);

        bool isClosed() const;
        tempo_utils::Status send(std::shared_ptr<const ResponseType> payload);
        tempo_utils::Status sendError(const tempo_utils::Status &error);
        tempo_utils::Status finish();

        tempo_utils::Status sendMessage(const StreamMessage<ResponseType> &message);
        tempo_utils::Status setHeader(const Metadata &metadata);
        tempo_utils::Status sendHeader(const Metadata &metadata);
        void setTrailer(const Metadata &metadata);
        CallScope scope() const;

    private:
        std::shared_ptr<DownloadStream<ResponseType>> m_stream;
    };

    template<class ResponseType>
    DownloadStream<ResponseType>::DownloadStream()
        : m_guard(&m_messages)
    {
    }

    template<class ResponseType>
    bool
    DownloadStream<ResponseType>::isClosed() const
    {
        return m_guard.isClosed();
    }

    template<class ResponseType>
    bool
    DownloadStream<ResponseType>::close()
    {
        return m_guard.close();
    }

    template<class ResponseType>
    HandoffChannel<StreamMessage<ResponseType>> *
    DownloadStream<ResponseType>::getMessages()
    {
        return &m_messages;
    }

    template<class ResponseType>
    DownloadClient<ResponseType>::DownloadClient(std::shared_ptr<DownloadStream<ResponseType>> stream)
        : m_stream(std::move(stream))
    {
        TU_ASSERT (m_stream != nullptr);
    }

    template<class ResponseType>
    bool
    DownloadClient<ResponseType>::isClosed() const
    {
        return m_stream->isClosed();
    }

    /**
     * Block until the server sends a message or the stream is closed. A closed stream yields
     * the end-of-stream message, which is the normal completion of a download.
     */
    template<class ResponseType>
    StreamMessage<ResponseType>
    DownloadClient<ResponseType>::receive()
    {
        StreamMessage<ResponseType> message;
        if (!m_stream->getMessages()->receive(message))
            return {};
        return message;
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadClient<ResponseType>::halfClose()
    {
        if (!m_stream->close())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        TU_LOG_V << "client closed download stream";
        return {};
    }

    template<class ResponseType>
    StreamMessage<ResponseType>
    DownloadClient<ResponseType>::receiveMessage()
    {
        return receive();
    }

    template<class ResponseType>
    Metadata
    DownloadClient<ResponseType>::header() const
    {
        return {};
    }

    template<class ResponseType>
    Metadata
    DownloadClient<ResponseType>::trailer() const
    {
        return {};
    }

    template<class ResponseType>
    CallScope
    DownloadClient<ResponseType>::scope() const
    {
        return CallScope::background();
    }

    template<class ResponseType>
    DownloadServer<ResponseType>::DownloadServer(std::shared_ptr<DownloadStream<ResponseType>> stream)
        : m_stream(std::move(stream))
    {
        TU_ASSERT (m_stream != nullptr);
    }

    template<class ResponseType>
    bool
    DownloadServer<ResponseType>::isClosed() const
    {
        return m_stream->isClosed();
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::send(std::shared_ptr<const ResponseType> payload)
    {
        if (payload == nullptr)
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "response payload cannot be nil");
        if (m_stream->isClosed())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        return m_stream->getMessages()->send(StreamMessage<ResponseType>::forPayload(std::move(payload)));
    }

    /**
     * Deliver a terminal error to the client and close the stream. The stream is closed even
     * if it was closed from the other side while the error was waiting to be received.
     */
    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::sendError(const tempo_utils::Status &error)
    {
        if (error.isOk())
            return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                "terminal error must not be ok");
        if (m_stream->isClosed())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        auto status = m_stream->getMessages()->send(StreamMessage<ResponseType>::forError(error));
        m_stream->close();
        return status;
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::finish()
    {
        if (!m_stream->close())
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed, "stream is closed");
        TU_LOG_V << "server finished download stream";
        return {};
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::sendMessage(const StreamMessage<ResponseType> &message)
    {
        switch (message.getType()) {
            case MessageType::Payload:
                return send(message.getPayload());
            case MessageType::Error:
                return sendError(message.getError());
            default:
                return StreamStatus::forCondition(StreamCondition::kInvalidArgument,
                    "message must carry a payload or an error");
        }
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::setHeader(const Metadata &metadata)
    {
        return {};
    }

    template<class ResponseType>
    tempo_utils::Status
    DownloadServer<ResponseType>::sendHeader(const Metadata &metadata)
    {
        return {};
    }

    template<class ResponseType>
    void
    DownloadServer<ResponseType>::setTrailer(const Metadata &metadata)
    {
    }

    template<class ResponseType>
    CallScope
    DownloadServer<ResponseType>::scope() const
    {
        return CallScope::background();
    }

    /**
     * A connected download client and server sharing one DownloadStream.
     */
    template<class ResponseType>
    struct DownloadEndpoints {
        std::unique_ptr<DownloadClient<ResponseType>> client;
        std::unique_ptr<DownloadServer<ResponseType>> server;
    };

    template<class ResponseType>
    DownloadEndpoints<ResponseType>
    open_download_stream()
    {
        auto stream = std::make_shared<DownloadStream<ResponseType>>();
        DownloadEndpoints<ResponseType> endpoints;
        endpoints.client = std::make_unique<DownloadClient<ResponseType>>(stream);
        endpoints.server = std::make_unique<DownloadServer<ResponseType>>(stream);
        return endpoints;
    }
}

#endif // CONDUIT_STREAM_DOWNLOAD_STREAM_H

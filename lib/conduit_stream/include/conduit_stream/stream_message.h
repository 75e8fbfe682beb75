#ifndef CONDUIT_STREAM_STREAM_MESSAGE_H
#define CONDUIT_STREAM_STREAM_MESSAGE_H

#include <memory>

#include <tempo_utils/status.h>

namespace conduit_stream {

    enum class MessageType {
        EndOfStream,
        Payload,
        Error,
    };

    /**
     * A single message on a stream half. A message carries either a payload or a terminal
     * error. A default constructed message is the end-of-stream sentinel, which is what a
     * receiver observes once the half is closed and no further message will arrive.
     *
     * @tparam PayloadType
     */
    template<class PayloadType>
    class StreamMessage {
    public:
        StreamMessage();

        static StreamMessage forPayload(std::shared_ptr<const PayloadType> payload);
        static StreamMessage forError(const tempo_utils::Status &error);

        MessageType getType() const;
        bool isEndOfStream() const;
        bool hasPayload() const;
        bool isError() const;

        std::shared_ptr<const PayloadType> getPayload() const;
        tempo_utils::Status getError() const;

    private:
        MessageType m_type;
        std::shared_ptr<const PayloadType> m_payload;
        tempo_utils::Status m_error;
    };

    template<class PayloadType>
    StreamMessage<PayloadType>::StreamMessage()
        : m_type(MessageType::EndOfStream)
    {
    }

    template<class PayloadType>
    StreamMessage<PayloadType>
    StreamMessage<PayloadType>::forPayload(std::shared_ptr<const PayloadType> payload)
    {
        StreamMessage message;
        message.m_type = MessageType::Payload;
        message.m_payload = std::move(payload);
        return message;
    }

    template<class PayloadType>
    StreamMessage<PayloadType>
    StreamMessage<PayloadType>::forError(const tempo_utils::Status &error)
    {
        StreamMessage message;
        message.m_type = MessageType::Error;
        message.m_error = error;
        return message;
    }

    template<class PayloadType>
    MessageType
    StreamMessage<PayloadType>::getType() const
    {
        return m_type;
    }

    template<class PayloadType>
    bool
    StreamMessage<PayloadType>::isEndOfStream() const
    {
        return m_type == MessageType::EndOfStream;
    }

    template<class PayloadType>
    bool
    StreamMessage<PayloadType>::hasPayload() const
    {
        return m_type == MessageType::Payload;
    }

    template<class PayloadType>
    bool
    StreamMessage<PayloadType>::isError() const
    {
        return m_type == MessageType::Error;
    }

    template<class PayloadType>
    std::shared_ptr<const PayloadType>
    StreamMessage<PayloadType>::getPayload() const
    {
        return m_payload;
    }

    template<class PayloadType>
    tempo_utils::Status
    StreamMessage<PayloadType>::getError() const
    {
        return m_error;
    }
}

#endif // CONDUIT_STREAM_STREAM_MESSAGE_H

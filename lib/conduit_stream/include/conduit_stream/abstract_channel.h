#ifndef CONDUIT_STREAM_ABSTRACT_CHANNEL_H
#define CONDUIT_STREAM_ABSTRACT_CHANNEL_H

#include <tempo_utils/status.h>

namespace conduit_stream {

    /**
     * The closing side of a channel. A channel may be closed exactly once; a second close
     * is a fault and returns kAlreadyClosed.
     */
    class AbstractChannel {
    public:
        virtual ~AbstractChannel() = default;

        virtual bool isClosed() const = 0;
        virtual tempo_utils::Status close() = 0;
    };
}

#endif // CONDUIT_STREAM_ABSTRACT_CHANNEL_H

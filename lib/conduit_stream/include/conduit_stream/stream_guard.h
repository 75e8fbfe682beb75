#ifndef CONDUIT_STREAM_STREAM_GUARD_H
#define CONDUIT_STREAM_STREAM_GUARD_H

#include <absl/synchronization/mutex.h>

#include "abstract_channel.h"

namespace conduit_stream {

    /**
     * Shared close state for a single channel. Either endpoint of a stream may close the
     * channel, from any thread and any number of times; the guard makes sure the channel
     * itself is closed exactly once. The guard does not own the channel.
     */
    class StreamGuard {
    public:
        explicit StreamGuard(AbstractChannel *channel);

        bool isClosed() const;
        bool close();

    private:
        AbstractChannel *m_channel;

        mutable absl::Mutex m_lock;
        bool m_closed ABSL_GUARDED_BY(m_lock);
    };
}

#endif // CONDUIT_STREAM_STREAM_GUARD_H


#include <conduit_stream/stream_guard.h>
#include <tempo_utils/log_stream.h>

conduit_stream::StreamGuard::StreamGuard(AbstractChannel *channel)
    : m_channel(channel),
      m_closed(false)
{
    TU_ASSERT (m_channel != nullptr);
}

bool
conduit_stream::StreamGuard::isClosed() const
{
    absl::MutexLock locker(&m_lock);
    return m_closed;
}

/**
 * Close the guarded channel if it has not been closed yet.
 *
 * @return true if this call closed the channel, false if it was already closed.
 */
bool
conduit_stream::StreamGuard::close()
{
    absl::MutexLock locker(&m_lock);
    if (m_closed)
        return false;
    auto status = m_channel->close();
    TU_LOG_WARN_IF (status.notOk()) << "failed to close channel: " << status.toString();
    m_closed = true;
    return true;
}

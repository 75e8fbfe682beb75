#ifndef CONDUIT_STREAM_HANDOFF_CHANNEL_H
#define CONDUIT_STREAM_HANDOFF_CHANNEL_H

#include <optional>

#include <absl/synchronization/mutex.h>

#include <tempo_utils/integer_types.h>
#include <tempo_utils/status.h>

#include "abstract_channel.h"
#include "stream_result.h"

namespace conduit_stream {

    /**
     * An unbuffered channel. send() places a single item in the hand-off slot and blocks
     * until a receiver has taken it, so a sender can never get ahead of its receiver. Items
     * are delivered in the order they were sent.
     *
     * Closing the channel wakes every blocked caller. Blocked and future receivers observe
     * the end of the channel, and a sender whose item was not yet taken fails with
     * kAlreadyClosed and the item is discarded. Once closed nothing more is delivered.
     *
     * @tparam ItemType
     */
    template<class ItemType>
    class HandoffChannel : public AbstractChannel {
    public:
        HandoffChannel();

        tempo_utils::Status send(ItemType item);
        bool receive(ItemType &item);

        bool isClosed() const override;
        tempo_utils::Status close() override;

    private:
        mutable absl::Mutex m_lock;
        absl::CondVar m_cond;
        bool m_closed ABSL_GUARDED_BY(m_lock);
        std::optional<ItemType> m_slot ABSL_GUARDED_BY(m_lock);
        tu_uint64 m_offered ABSL_GUARDED_BY(m_lock);
        tu_uint64 m_taken ABSL_GUARDED_BY(m_lock);
    };

    template<class ItemType>
    HandoffChannel<ItemType>::HandoffChannel()
        : m_closed(false),
          m_offered(0),
          m_taken(0)
    {
    }

    template<class ItemType>
    tempo_utils::Status
    HandoffChannel<ItemType>::send(ItemType item)
    {
        absl::MutexLock locker(&m_lock);

        // wait for any other sender to finish its hand-off
        while (!m_closed && m_slot.has_value()) {
            m_cond.Wait(&m_lock);
        }
        if (m_closed)
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed,
                "channel is closed");

        m_slot.emplace(std::move(item));
        auto ticket = ++m_offered;
        m_cond.SignalAll();

        // block until a receiver takes the item or the channel is closed
        while (!m_closed && m_taken < ticket) {
            m_cond.Wait(&m_lock);
        }
        if (m_taken < ticket) {
            m_slot.reset();
            m_cond.SignalAll();
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed,
                "channel was closed before the item was received");
        }

        return {};
    }

    template<class ItemType>
    bool
    HandoffChannel<ItemType>::receive(ItemType &item)
    {
        absl::MutexLock locker(&m_lock);

        while (!m_closed && !m_slot.has_value()) {
            m_cond.Wait(&m_lock);
        }
        if (m_closed)
            return false;

        item = std::move(*m_slot);
        m_slot.reset();
        m_taken++;
        m_cond.SignalAll();
        return true;
    }

    template<class ItemType>
    bool
    HandoffChannel<ItemType>::isClosed() const
    {
        absl::MutexLock locker(&m_lock);
        return m_closed;
    }

    template<class ItemType>
    tempo_utils::Status
    HandoffChannel<ItemType>::close()
    {
        absl::MutexLock locker(&m_lock);
        if (m_closed)
            return StreamStatus::forCondition(StreamCondition::kAlreadyClosed,
                "channel is already closed");
        m_closed = true;
        m_cond.SignalAll();
        return {};
    }
}

#endif // CONDUIT_STREAM_HANDOFF_CHANNEL_H

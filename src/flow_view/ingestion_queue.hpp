#ifndef INGESTION_QUEUE_HPP
#define INGESTION_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "flow_event.hpp"

class View;

// Hands FlowEvents from producer threads to the thread that owns a View.
// push() and close() may be called from any thread; drain() and apply()
// belong to the consumer.
class IngestionQueue
{
   public:
    IngestionQueue() = default;

    IngestionQueue(const IngestionQueue&) = delete;
    IngestionQueue& operator=(const IngestionQueue&) = delete;

    // Returns false once the queue is closed
    bool push(FlowEvent event);

    // Wakes waiting consumers; later pushes are rejected
    void close();
    bool closed() const;

    // Blocks until events are pending, the queue is closed or `timeout`
    // expires. Returns true if events are pending.
    bool waitFor(std::chrono::milliseconds timeout);

    std::vector<FlowEvent> drain();

    // Drains and applies every pending event to `view`. Returns the number
    // of events applied.
    size_t apply(View& view);

    size_t size() const;

   private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<FlowEvent> m_events;
    bool m_closed{false};
};

// Applies one producer event: a Request adds the flow, a Response or Error
// copies the exchange into the stored flow and updates it. Returns false if
// the event refers to a flow the view does not hold.
bool apply_event(View& view, const FlowEvent& event);

#endif  // INGESTION_QUEUE_HPP

#include "ingestion_queue.hpp"

#include <iterator>

#include "flow_view.hpp"
#include "logger.hpp"

bool IngestionQueue::push(FlowEvent event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed)
        {
            return false;
        }
        m_events.push_back(std::move(event));
    }
    m_cv.notify_one();
    return true;
}

void IngestionQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool IngestionQueue::closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool IngestionQueue::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_events.empty() || m_closed; });
    return !m_events.empty();
}

std::vector<FlowEvent> IngestionQueue::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<FlowEvent> out(std::make_move_iterator(m_events.begin()),
                               std::make_move_iterator(m_events.end()));
    m_events.clear();
    return out;
}

size_t IngestionQueue::apply(View& view)
{
    size_t applied = 0;
    for (const auto& event : drain())
    {
        if (apply_event(view, event))
        {
            applied++;
        }
    }
    return applied;
}

size_t IngestionQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

bool apply_event(View& view, const FlowEvent& event)
{
    if (!event.flow)
    {
        return false;
    }

    FlowPtr stored = view.getById(event.flow->id());
    if (event.kind == FlowEventKind::Request && !stored)
    {
        view.onRequest(event.flow);
        return true;
    }
    if (!stored)
    {
        LOG_WARNING(toString(event.kind) << " event for unknown flow " << event.flow->id());
        return false;
    }

    stored->request = event.flow->request;
    stored->response = event.flow->response;
    stored->error = event.flow->error;

    if (event.kind == FlowEventKind::Error)
    {
        view.onError(stored);
    }
    else
    {
        view.onResponse(stored);
    }
    return true;
}

#include "order_key.hpp"

#include <atomic>

#include "flow_view.hpp"
#include "logger.hpp"

namespace
{

OrderKeyToken next_token()
{
    static std::atomic<OrderKeyToken> counter{0};
    return ++counter;
}

}  // namespace

std::string to_string(const OrderValue& value)
{
    if (const auto* n = std::get_if<uint64_t>(&value))
    {
        return std::to_string(*n);
    }
    return std::get<std::string>(value);
}

OrderKey::OrderKey(View& view, std::string name)
    : m_view(view), m_name(std::move(name)), m_token(next_token())
{
}

OrderValue OrderKey::value(const FlowPtr& flow) const
{
    if (!m_view.m_store.contains(flow->id()))
    {
        return generate(*flow);
    }
    OrderCache& cache = m_view.m_settings.orderCache(*flow);
    auto it = cache.find(m_token);
    if (it != cache.end())
    {
        return it->second;
    }
    OrderValue val = generate(*flow);
    cache[m_token] = val;
    return val;
}

void OrderKey::refresh(const FlowPtr& flow)
{
    if (!m_view.m_store.contains(flow->id()))
    {
        return;
    }
    OrderCache& cache = m_view.m_settings.orderCache(*flow);
    OrderValue fresh = generate(*flow);
    auto it = cache.find(m_token);
    if (it != cache.end() && it->second == fresh)
    {
        return;
    }

    // Only the active key positions flows in the index
    if (m_view.m_order_key != this || !m_view.contains(flow))
    {
        cache[m_token] = fresh;
        return;
    }

    LOG_DEBUG("order '" << m_name << "' stale for flow " << flow->id() << ": "
              << (it != cache.end() ? to_string(it->second) : std::string("<none>")) << " -> "
              << to_string(fresh));

    m_view.indexErase(flow);
    cache[m_token] = fresh;
    m_view.indexInsert(flow, fresh);
    m_view.m_signals.viewRefresh.emit();
}

OrderValue OrderRequestStart::generate(const Flow& flow) const
{
    return OrderValue(flow.request.timestamp_start_ms);
}

OrderValue OrderRequestMethod::generate(const Flow& flow) const
{
    return OrderValue(flow.request.method);
}

OrderValue OrderRequestUrl::generate(const Flow& flow) const
{
    return OrderValue(flow.request.url());
}

OrderValue OrderKeySize::generate(const Flow& flow) const
{
    uint64_t size = 0;
    if (flow.request.raw_content)
    {
        size += flow.request.raw_content->size();
    }
    if (flow.response && flow.response->raw_content)
    {
        size += flow.response->raw_content->size();
    }
    return OrderValue(size);
}

#include "flow_settings.hpp"

#include "flow_errors.hpp"
#include "logger.hpp"

FlowSettings::FlowSettings(const FlowStore& store, ViewSignals& signals)
    : m_store(store), m_signals(signals)
{
    m_remove_conn =
        m_signals.storeRemove.connect([this](const FlowPtr& flow) { onStoreRemove(flow); });
    m_refresh_conn = m_signals.storeRefresh.connect([this]() { onStoreRefresh(); });
}

FlowSettings::~FlowSettings()
{
    m_signals.storeRemove.disconnect(m_remove_conn);
    m_signals.storeRefresh.disconnect(m_refresh_conn);
}

FlowSettings::Entry& FlowSettings::entry(const Flow& flow)
{
    if (!m_store.contains(flow.id()))
    {
        throw UnknownIdAccess(flow.id());
    }
    return m_entries[flow.id()];
}

FlowValues& FlowSettings::get(const Flow& flow)
{
    return entry(flow).values;
}

OrderCache& FlowSettings::orderCache(const Flow& flow)
{
    return entry(flow).order_cache;
}

const OrderCache* FlowSettings::findOrderCache(const std::string& id) const
{
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : &it->second.order_cache;
}

void FlowSettings::dropOrderToken(OrderKeyToken token)
{
    for (auto& [id, entry] : m_entries)
    {
        entry.order_cache.erase(token);
    }
}

std::vector<std::string> FlowSettings::ids() const
{
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries)
    {
        out.push_back(id);
    }
    return out;
}

void FlowSettings::onStoreRemove(const FlowPtr& flow)
{
    m_entries.erase(flow->id());
}

void FlowSettings::onStoreRefresh()
{
    size_t pruned = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (!m_store.contains(it->first))
        {
            it = m_entries.erase(it);
            ++pruned;
        }
        else
        {
            ++it;
        }
    }
    if (pruned > 0)
    {
        LOG_DEBUG("settings: pruned " << pruned << " entries after store refresh");
    }
}

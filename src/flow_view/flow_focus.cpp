#include "flow_focus.hpp"

#include <algorithm>

#include "flow_errors.hpp"
#include "flow_view.hpp"

FlowFocus::FlowFocus(View& view) : m_view(view)
{
    if (!m_view.empty())
    {
        m_flow = m_view.at(0);
    }
    ViewSignals& signals = m_view.signals();
    m_add_conn = signals.viewAdd.connect([this](const FlowPtr& flow) { onViewAdd(flow); });
    m_remove_conn =
        signals.viewRemove.connect([this](const FlowPtr& flow) { onViewRemove(flow); });
    m_refresh_conn = signals.viewRefresh.connect([this]() { onViewRefresh(); });
}

FlowFocus::~FlowFocus()
{
    ViewSignals& signals = m_view.signals();
    signals.viewAdd.disconnect(m_add_conn);
    signals.viewRemove.disconnect(m_remove_conn);
    signals.viewRefresh.disconnect(m_refresh_conn);
}

void FlowFocus::setFlow(const FlowPtr& flow)
{
    if (flow && !m_view.contains(flow))
    {
        throw FocusNotInView();
    }
    m_flow = flow;
    sigChange.emit();
}

std::optional<size_t> FlowFocus::index() const
{
    if (!m_flow)
    {
        return std::nullopt;
    }
    return m_view.indexOf(m_flow);
}

void FlowFocus::setIndex(long long index)
{
    if (!m_view.inbounds(index))
    {
        throw OutOfBounds("Index out of view bounds");
    }
    setFlow(m_view.at(index));
}

size_t FlowFocus::nearest(const FlowPtr& flow) const
{
    return std::min(m_view.bisect(flow), m_view.size() - 1);
}

void FlowFocus::onViewAdd(const FlowPtr& flow)
{
    if (!m_flow)
    {
        setFlow(flow);
    }
}

void FlowFocus::onViewRemove(const FlowPtr& flow)
{
    if (m_view.empty())
    {
        setFlow(nullptr);
    }
    else if (same_flow(flow, m_flow))
    {
        setFlow(m_view.at(static_cast<long long>(nearest(m_flow))));
    }
}

void FlowFocus::onViewRefresh()
{
    if (m_view.empty())
    {
        setFlow(nullptr);
    }
    else if (!m_flow)
    {
        setFlow(m_view.at(0));
    }
    else if (!m_view.contains(m_flow))
    {
        setFlow(m_view.at(static_cast<long long>(nearest(m_flow))));
    }
}

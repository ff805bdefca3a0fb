#include "view_commands.hpp"

#include "logger.hpp"

ViewCommands::ViewCommands(View& view, UpdateHandler on_update)
    : m_view(view), m_on_update(std::move(on_update))
{
}

void ViewCommands::focusNext()
{
    std::optional<size_t> current = m_view.focus().index();
    if (!current)
    {
        return;
    }
    long long idx = static_cast<long long>(*current) + 1;
    if (m_view.inbounds(idx))
    {
        m_view.focus().setFlow(m_view.at(idx));
    }
}

void ViewCommands::focusPrev()
{
    std::optional<size_t> current = m_view.focus().index();
    if (!current)
    {
        return;
    }
    long long idx = static_cast<long long>(*current) - 1;
    if (m_view.inbounds(idx))
    {
        m_view.focus().setFlow(m_view.at(idx));
    }
}

std::vector<std::string> ViewCommands::orderOptions() const
{
    return m_view.orderOptions();
}

void ViewCommands::toggleMarked()
{
    m_view.toggleShowMarkedOnly();
}

std::string ViewCommands::getValue(const FlowPtr& flow, const std::string& key,
                                   const std::string& default_value) const
{
    const FlowValues& values = m_view.settings().get(*flow);
    auto it = values.find(key);
    return it == values.end() ? default_value : it->second;
}

void ViewCommands::setValue(const std::vector<FlowPtr>& flows, const std::string& key,
                            const std::string& value)
{
    std::vector<FlowPtr> updated;
    for (const FlowPtr& flow : flows)
    {
        m_view.settings().get(*flow)[key] = value;
        updated.push_back(flow);
    }
    notifyUpdated(updated);
}

void ViewCommands::setValueToggle(const std::vector<FlowPtr>& flows, const std::string& key)
{
    std::vector<FlowPtr> updated;
    for (const FlowPtr& flow : flows)
    {
        FlowValues& values = m_view.settings().get(*flow);
        auto it = values.find(key);
        const bool current = it != values.end() && it->second == "true";
        values[key] = current ? "false" : "true";
        updated.push_back(flow);
    }
    notifyUpdated(updated);
}

size_t ViewCommands::load(FlowReader& reader, const std::string& path)
{
    std::vector<FlowPtr> flows = reader.read(path);
    for (const FlowPtr& flow : flows)
    {
        // Fresh ids so the same source can be loaded repeatedly
        m_view.add({flow->copy()});
    }
    LOG_INFO("Loaded " << flows.size() << " flows from " << path << " ("
             << reader.getFormatName() << ")");
    return flows.size();
}

void ViewCommands::go(long long offset)
{
    const long long count = static_cast<long long>(m_view.size());
    if (count == 0)
    {
        return;
    }
    if (offset < 0)
    {
        offset = count + offset;
    }
    if (offset < 0)
    {
        offset = 0;
    }
    if (offset > count - 1)
    {
        offset = count - 1;
    }
    m_view.focus().setFlow(m_view.at(offset));
}

void ViewCommands::duplicate(const std::vector<FlowPtr>& flows)
{
    std::vector<FlowPtr> dups;
    dups.reserve(flows.size());
    for (const FlowPtr& flow : flows)
    {
        if (flow)
        {
            dups.push_back(flow->copy());
        }
    }
    if (dups.empty())
    {
        return;
    }
    m_view.add(dups);
    if (m_view.contains(dups.front()))
    {
        m_view.focus().setFlow(dups.front());
    }
    LOG_INFO("Duplicated " << dups.size() << " flows");
}

void ViewCommands::remove(const std::vector<FlowPtr>& flows)
{
    m_view.remove(flows);
}

std::vector<FlowPtr> ViewCommands::resolve(const std::string& selector) const
{
    return m_view.resolve(selector);
}

FlowPtr ViewCommands::create(const std::string& method, const std::string& url)
{
    FlowPtr flow = Flow::make(method, url);
    m_view.add({flow});
    return flow;
}

void ViewCommands::notifyUpdated(const std::vector<FlowPtr>& flows)
{
    if (m_on_update)
    {
        m_on_update(flows);
    }
}

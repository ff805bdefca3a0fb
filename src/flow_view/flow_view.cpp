#include "flow_view.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>

#include "flow_errors.hpp"
#include "logger.hpp"

View::View(std::shared_ptr<const FilterParser> parser)
    : m_settings(m_store, m_signals),
      m_parser(parser ? std::move(parser) : std::make_shared<SimpleFilterParser>()),
      m_filter(match_all()),
      m_focus(*this)
{
    registerOrder(std::make_unique<OrderRequestStart>(*this));
    registerOrder(std::make_unique<OrderRequestMethod>(*this));
    registerOrder(std::make_unique<OrderRequestUrl>(*this));
    registerOrder(std::make_unique<OrderKeySize>(*this));
    m_order_key = m_orders.at("time").get();
}

View::~View() = default;

bool View::inbounds(long long index) const
{
    return index >= 0 && static_cast<size_t>(index) < m_index.size();
}

FlowPtr View::at(long long offset) const
{
    const long long count = static_cast<long long>(m_index.size());
    long long pos = offset < 0 ? count + offset : offset;
    if (pos < 0 || pos >= count)
    {
        throw OutOfBounds("View offset " + std::to_string(offset) + " out of range (size " +
                          std::to_string(count) + ")");
    }
    return m_index[toIndex(static_cast<size_t>(pos))].flow;
}

size_t View::indexOf(const FlowPtr& flow) const
{
    size_t pos = indexPosition(flow);
    return m_reversed ? m_index.size() - pos - 1 : pos;
}

bool View::contains(const FlowPtr& flow) const
{
    return flow && m_indexed.count(flow->id()) != 0;
}

std::vector<FlowPtr> View::shown() const
{
    std::vector<FlowPtr> out;
    out.reserve(m_index.size());
    for (size_t i = 0; i < m_index.size(); ++i)
    {
        out.push_back(m_index[toIndex(i)].flow);
    }
    return out;
}

bool View::passes(const Flow& flow) const
{
    if (m_show_marked && !flow.marked)
    {
        return false;
    }
    return m_filter(flow);
}

void View::baseAdd(const FlowPtr& flow)
{
    OrderValue value = m_order_key->generate(*flow);
    m_settings.orderCache(*flow)[m_order_key->token()] = value;
    indexInsert(flow, value);
}

void View::indexInsert(const FlowPtr& flow, const OrderValue& value)
{
    IndexEntry entry{value, m_store.sequence(flow->id()), flow};
    auto it = std::upper_bound(m_index.begin(), m_index.end(), entry, IndexLess());
    m_index.insert(it, std::move(entry));
    m_indexed.insert(flow->id());
}

size_t View::indexPosition(const FlowPtr& flow) const
{
    if (!contains(flow))
    {
        throw OutOfBounds("Flow " + (flow ? flow->id() : std::string("<null>")) +
                          " is not in view");
    }

    const OrderCache* cache = m_settings.findOrderCache(flow->id());
    auto cached = cache ? cache->find(m_order_key->token()) : OrderCache::const_iterator();
    if (cache && cached != cache->end())
    {
        IndexEntry probe{cached->second, m_store.sequence(flow->id()), nullptr};
        auto it = std::lower_bound(m_index.begin(), m_index.end(), probe, IndexLess());
        if (it != m_index.end() && it->flow->id() == flow->id())
        {
            return static_cast<size_t>(it - m_index.begin());
        }
    }

    LOG_WARNING("order cache out of step for flow " << flow->id() << ", scanning index");
    for (size_t i = 0; i < m_index.size(); ++i)
    {
        if (m_index[i].flow->id() == flow->id())
        {
            return i;
        }
    }
    throw OutOfBounds("Flow " + flow->id() + " is not in view");
}

bool View::indexErase(const FlowPtr& flow)
{
    if (!contains(flow))
    {
        return false;
    }
    size_t pos = indexPosition(flow);
    m_index.erase(m_index.begin() + static_cast<std::ptrdiff_t>(pos));
    m_indexed.erase(flow->id());
    return true;
}

size_t View::bisect(const FlowPtr& flow) const
{
    const bool stored = m_store.contains(flow->id());
    IndexEntry probe{m_order_key->value(flow),
                     stored ? m_store.sequence(flow->id())
                            : std::numeric_limits<uint64_t>::max(),
                     nullptr};
    auto it = std::upper_bound(m_index.begin(), m_index.end(), probe, IndexLess());
    size_t pos = static_cast<size_t>(it - m_index.begin());
    return m_reversed ? m_index.size() - pos : pos;
}

void View::refilter()
{
    m_index.clear();
    m_indexed.clear();
    for (const FlowPtr& flow : m_store.all())
    {
        if (passes(*flow))
        {
            baseAdd(flow);
        }
    }
    LOG_DEBUG("view refiltered: " << m_index.size() << " of " << m_store.size()
              << " flows shown");
    m_signals.viewRefresh.emit();
}

void View::rebuildIndex()
{
    std::vector<IndexEntry> previous;
    previous.swap(m_index);
    m_indexed.clear();
    for (const IndexEntry& entry : previous)
    {
        baseAdd(entry.flow);
    }
}

void View::add(const std::vector<FlowPtr>& flows)
{
    for (const FlowPtr& flow : flows)
    {
        if (!flow || !m_store.put(flow))
        {
            continue;
        }
        if (passes(*flow))
        {
            baseAdd(flow);
            if (m_focus_follow)
            {
                m_focus.setFlow(flow);
            }
            m_signals.viewAdd.emit(flow);
        }
    }
}

void View::update(const std::vector<FlowPtr>& flows)
{
    for (const FlowPtr& flow : flows)
    {
        if (!flow)
        {
            continue;
        }
        FlowPtr stored = m_store.get(flow->id());
        if (!stored)
        {
            continue;
        }
        if (passes(*stored))
        {
            if (!contains(stored))
            {
                baseAdd(stored);
                if (m_focus_follow)
                {
                    m_focus.setFlow(stored);
                }
                m_signals.viewAdd.emit(stored);
            }
            else
            {
                m_order_key->refresh(stored);
                m_signals.viewUpdate.emit(stored);
            }
        }
        else if (indexErase(stored))
        {
            m_signals.viewRemove.emit(stored);
        }
    }
}

void View::remove(const std::vector<FlowPtr>& flows)
{
    for (const FlowPtr& flow : flows)
    {
        if (!flow)
        {
            continue;
        }
        FlowPtr stored = m_store.get(flow->id());
        if (!stored)
        {
            continue;
        }
        if (stored->killable())
        {
            stored->kill();
        }
        if (indexErase(stored))
        {
            m_signals.viewRemove.emit(stored);
        }
        m_store.erase(stored->id());
        m_signals.storeRemove.emit(stored);
    }
}

void View::setFilter(std::optional<FlowFilter> filter)
{
    m_filter = filter ? std::move(*filter) : match_all();
    refilter();
}

void View::setFilterExpression(const std::string& expr)
{
    if (expr.empty())
    {
        setFilter(std::nullopt);
        return;
    }
    std::optional<FlowFilter> filter = m_parser->parse(expr);
    if (!filter)
    {
        throw InvalidFilterExpression(expr);
    }
    setFilter(std::move(filter));
}

void View::registerOrder(std::unique_ptr<OrderKey> key)
{
    if (!key)
    {
        return;
    }
    const std::string name = key->name();
    auto it = m_orders.find(name);
    if (it == m_orders.end())
    {
        m_orders[name] = std::move(key);
        return;
    }

    // Cached values of the replaced key are never read again
    m_settings.dropOrderToken(it->second->token());
    const bool active = it->second.get() == m_order_key;
    it->second = std::move(key);
    if (active)
    {
        m_order_key = it->second.get();
        rebuildIndex();
        m_signals.viewRefresh.emit();
    }
}

OrderKey& View::order(const std::string& name) const
{
    auto it = m_orders.find(name);
    if (it == m_orders.end())
    {
        throw UnknownOrderName(name);
    }
    return *it->second;
}

std::vector<std::string> View::orderOptions() const
{
    std::vector<std::string> names;
    names.reserve(m_orders.size());
    for (const auto& [name, key] : m_orders)
    {
        names.push_back(name);
    }
    return names;
}

void View::setOrder(const std::string& name)
{
    OrderKey& key = order(name);
    m_order_key = &key;
    rebuildIndex();
    LOG_DEBUG("view order set to '" << name << "'");
    m_signals.viewRefresh.emit();
}

void View::setReversed(bool reversed)
{
    m_reversed = reversed;
    m_signals.viewRefresh.emit();
}

void View::toggleShowMarkedOnly()
{
    m_show_marked = !m_show_marked;
    refilter();
}

void View::clear()
{
    m_store.clear();
    m_index.clear();
    m_indexed.clear();
    m_signals.viewRefresh.emit();
    m_signals.storeRefresh.emit();
}

void View::clearNotMarked()
{
    for (const FlowPtr& flow : m_store.all())
    {
        if (!flow->marked)
        {
            m_store.erase(flow->id());
        }
    }
    refilter();
    m_signals.storeRefresh.emit();
}

std::vector<FlowPtr> View::resolve(const std::string& selector) const
{
    std::vector<FlowPtr> all = m_store.all();
    std::vector<FlowPtr> out;

    if (selector == "@all")
    {
        return all;
    }
    if (selector == "@focus")
    {
        if (m_focus.flow())
        {
            out.push_back(m_focus.flow());
        }
        return out;
    }
    if (selector == "@shown")
    {
        return shown();
    }

    FlowFilter filter;
    if (selector == "@hidden")
    {
        filter = [this](const Flow& f) { return m_indexed.count(f.id()) == 0; };
    }
    else if (selector == "@marked")
    {
        filter = [](const Flow& f) { return f.marked; };
    }
    else if (selector == "@unmarked")
    {
        filter = [](const Flow& f) { return !f.marked; };
    }
    else
    {
        std::optional<FlowFilter> parsed = m_parser->parse(selector);
        if (!parsed)
        {
            throw InvalidFilterExpression(selector);
        }
        filter = std::move(*parsed);
    }

    std::copy_if(all.begin(), all.end(), std::back_inserter(out),
                 [&filter](const FlowPtr& f) { return filter(*f); });
    return out;
}

void View::configure(const ViewOptions& options)
{
    std::optional<FlowFilter> filter;
    if (options.view_filter && !options.view_filter->empty())
    {
        filter = m_parser->parse(*options.view_filter);
        if (!filter)
        {
            throw InvalidFilterExpression(*options.view_filter);
        }
    }
    if (options.order)
    {
        order(*options.order);
    }

    bool needs_refilter = false;
    if (options.view_filter)
    {
        m_filter = filter ? std::move(*filter) : match_all();
        needs_refilter = true;
    }
    if (options.show_marked_only && *options.show_marked_only != m_show_marked)
    {
        m_show_marked = *options.show_marked_only;
        needs_refilter = true;
    }
    if (needs_refilter)
    {
        refilter();
    }
    if (options.order)
    {
        setOrder(*options.order);
    }
    if (options.order_reversed)
    {
        setReversed(*options.order_reversed);
    }
    if (options.focus_follow)
    {
        m_focus_follow = *options.focus_follow;
    }
}

#ifndef FLOW_VIEW_HPP
#define FLOW_VIEW_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "flow.hpp"
#include "flow_filter.hpp"
#include "flow_focus.hpp"
#include "flow_settings.hpp"
#include "flow_store.hpp"
#include "order_key.hpp"
#include "signal.hpp"
#include "view_options.hpp"

// Filtered, sorted projection over a FlowStore.
//
// The view owns the store, the per-flow settings and the focus. Flows enter
// and leave through add()/update()/remove(); every change of the displayed
// set is announced on signals() after the view's own state is complete.
//
// Not thread-safe: every call, including read-only queries, must run on the
// owning thread. Signal handlers must not call back into add(), update(),
// remove() or any other mutating operation of the same view.
class View
{
   public:
    explicit View(std::shared_ptr<const FilterParser> parser = nullptr);
    ~View();

    View(const View&) = delete;
    View& operator=(const View&) = delete;

    // Number of displayed flows
    size_t size() const { return m_index.size(); }
    bool empty() const { return m_index.empty(); }

    // Is 0 <= index < size()
    bool inbounds(long long index) const;

    // Flow at a displayed offset. Negative offsets count from the end (-1 is
    // the last displayed flow). Throws OutOfBounds.
    FlowPtr at(long long offset) const;

    // Displayed offset of a shown flow. Throws OutOfBounds if not shown.
    size_t indexOf(const FlowPtr& flow) const;

    bool contains(const FlowPtr& flow) const;

    // Displayed sequence, first to last
    std::vector<FlowPtr> shown() const;

    size_t storeCount() const { return m_store.size(); }
    FlowPtr getById(const std::string& id) const { return m_store.get(id); }

    // Adds flows to the store; flows already stored are ignored
    void add(const std::vector<FlowPtr>& flows);

    // Re-evaluates stored flows against the filter and their sort position.
    // Flows not in the store are ignored. The stored instance is the one
    // evaluated, so producers mutate the record before calling update().
    void update(const std::vector<FlowPtr>& flows);

    // Removes flows from the view and the store, killing killable ones
    void remove(const std::vector<FlowPtr>& flows);

    // Replaces the filter (nullopt shows everything) and rebuilds the view
    void setFilter(std::optional<FlowFilter> filter);

    // Parses `expr` with the view's filter parser; empty shows everything.
    // Throws InvalidFilterExpression and keeps the current filter.
    void setFilterExpression(const std::string& expr);

    // Switches the active order key. Throws UnknownOrderName.
    void setOrder(const std::string& name);

    // Adds a custom order key (replacing one of the same name)
    void registerOrder(std::unique_ptr<OrderKey> key);

    const OrderKey& orderKey() const { return *m_order_key; }

    // Registered key by name. Throws UnknownOrderName.
    OrderKey& order(const std::string& name) const;

    // Names of all order keys, sorted
    std::vector<std::string> orderOptions() const;

    void setReversed(bool reversed);
    bool reversed() const { return m_reversed; }

    void toggleShowMarkedOnly();
    bool showMarkedOnly() const { return m_show_marked; }

    void setFocusFollow(bool follow) { m_focus_follow = follow; }
    bool focusFollow() const { return m_focus_follow; }

    // Empties store and view
    void clear();

    // Drops every unmarked flow from the store
    void clearNotMarked();

    // Resolves @all, @focus, @shown, @hidden, @marked, @unmarked or a filter
    // expression to flows. Throws InvalidFilterExpression.
    std::vector<FlowPtr> resolve(const std::string& selector) const;

    // Applies the options that are set. Everything is validated before
    // anything is applied.
    void configure(const ViewOptions& options);

    // Producer event hooks
    void onRequest(const FlowPtr& flow) { add({flow}); }
    void onResponse(const FlowPtr& flow) { update({flow}); }
    void onError(const FlowPtr& flow) { update({flow}); }
    void onIntercept(const FlowPtr& flow) { update({flow}); }
    void onResume(const FlowPtr& flow) { update({flow}); }
    void onKill(const FlowPtr& flow) { update({flow}); }

    // Displayed position just after where `flow` sorts under the active key
    size_t bisect(const FlowPtr& flow) const;

    ViewSignals& signals() { return m_signals; }
    FlowSettings& settings() { return m_settings; }
    FlowFocus& focus() { return m_focus; }
    const FlowFocus& focus() const { return m_focus; }
    const FilterParser& filterParser() const { return *m_parser; }

   private:
    friend class OrderKey;

    struct IndexEntry
    {
        OrderValue value;
        uint64_t sequence;
        FlowPtr flow;
    };

    struct IndexLess
    {
        bool operator()(const IndexEntry& a, const IndexEntry& b) const
        {
            if (a.value != b.value)
                return a.value < b.value;
            return a.sequence < b.sequence;
        }
    };

    bool passes(const Flow& flow) const;
    void baseAdd(const FlowPtr& flow);
    void refilter();
    void rebuildIndex();

    void indexInsert(const FlowPtr& flow, const OrderValue& value);
    bool indexErase(const FlowPtr& flow);
    size_t indexPosition(const FlowPtr& flow) const;

    // Maps between displayed offsets and ascending index positions
    size_t toIndex(size_t displayed) const
    {
        return m_reversed ? m_index.size() - displayed - 1 : displayed;
    }

    // Declaration order matters: signals outlive their subscribers
    ViewSignals m_signals;
    FlowStore m_store;
    FlowSettings m_settings;
    std::shared_ptr<const FilterParser> m_parser;
    std::map<std::string, std::unique_ptr<OrderKey>> m_orders;
    OrderKey* m_order_key{nullptr};
    FlowFilter m_filter;
    bool m_show_marked{false};
    bool m_reversed{false};
    bool m_focus_follow{false};
    std::vector<IndexEntry> m_index;
    std::unordered_set<std::string> m_indexed;
    FlowFocus m_focus;
};

#endif  // FLOW_VIEW_HPP

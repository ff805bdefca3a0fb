#ifndef FLOW_SETTINGS_HPP
#define FLOW_SETTINGS_HPP

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "flow.hpp"
#include "flow_store.hpp"
#include "order_key.hpp"
#include "signal.hpp"

using FlowValues = std::map<std::string, std::string>;
using OrderCache = std::map<OrderKeyToken, OrderValue>;

// Per-flow key/value metadata whose lifetime follows store membership.
//
// Entries are created lazily, only for flows the store holds, and are dropped
// on store-remove (one flow) and store-refresh (every id the store no longer
// holds). Each entry also carries the order keys' cached sort values.
class FlowSettings
{
   public:
    FlowSettings(const FlowStore& store, ViewSignals& signals);
    ~FlowSettings();

    FlowSettings(const FlowSettings&) = delete;
    FlowSettings& operator=(const FlowSettings&) = delete;

    // Throws UnknownIdAccess if the flow is not in the store
    FlowValues& get(const Flow& flow);

    // Order key cache of a stored flow. Throws UnknownIdAccess.
    OrderCache& orderCache(const Flow& flow);

    // Forgets the cached values of one order key in every entry
    void dropOrderToken(OrderKeyToken token);

    // Existing order key cache, nullptr if the flow has no entry yet
    const OrderCache* findOrderCache(const std::string& id) const;

    bool contains(const std::string& id) const { return m_entries.count(id) != 0; }
    size_t size() const { return m_entries.size(); }
    std::vector<std::string> ids() const;

   private:
    struct Entry
    {
        FlowValues values;
        OrderCache order_cache;
    };

    Entry& entry(const Flow& flow);
    void onStoreRemove(const FlowPtr& flow);
    void onStoreRefresh();

    const FlowStore& m_store;
    ViewSignals& m_signals;
    std::unordered_map<std::string, Entry> m_entries;
    Signal<const FlowPtr&>::Connection m_remove_conn;
    Signal<>::Connection m_refresh_conn;
};

#endif  // FLOW_SETTINGS_HPP

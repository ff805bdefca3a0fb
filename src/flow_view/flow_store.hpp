#ifndef FLOW_STORE_HPP
#define FLOW_STORE_HPP

#include <cstdint>
#include <iterator>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>

#include "flow.hpp"

// Authoritative collection of every known flow, keyed by id, in insertion
// order. Each flow gets a monotonically increasing insertion sequence that
// the view uses to break ties between equal order values.
class FlowStore
{
   public:
    FlowStore() = default;
    ~FlowStore() = default;

    // Returns false (and changes nothing) if the id is already present
    bool put(const FlowPtr& flow)
    {
        if (m_index.count(flow->id()) != 0)
        {
            return false;
        }
        m_order.push_back(Entry{flow, ++m_last_sequence});
        auto it = std::prev(m_order.end());
        m_index.emplace(flow->id(), it);
        return true;
    }

    FlowPtr get(const std::string& id) const
    {
        auto it = m_index.find(id);
        if (it == m_index.end())
        {
            return nullptr;
        }
        return it->second->flow;
    }

    bool erase(const std::string& id)
    {
        auto it = m_index.find(id);
        if (it == m_index.end())
        {
            return false;
        }
        m_order.erase(it->second);
        m_index.erase(it);
        return true;
    }

    bool contains(const std::string& id) const { return m_index.count(id) != 0; }

    // Insertion sequence of a stored flow, 0 if absent
    uint64_t sequence(const std::string& id) const
    {
        auto it = m_index.find(id);
        return it == m_index.end() ? 0 : it->second->sequence;
    }

    std::vector<FlowPtr> all() const
    {
        std::vector<FlowPtr> out;
        out.reserve(m_order.size());
        for (const auto& entry : m_order)
        {
            out.push_back(entry.flow);
        }
        return out;
    }

    void clear()
    {
        m_order.clear();
        m_index.clear();
    }

    size_t size() const { return m_order.size(); }

    bool empty() const { return m_order.empty(); }

   private:
    struct Entry
    {
        FlowPtr flow;
        uint64_t sequence;
    };

    std::list<Entry> m_order;
    std::unordered_map<std::string, std::list<Entry>::iterator> m_index;
    uint64_t m_last_sequence{0};
};

#endif  // FLOW_STORE_HPP

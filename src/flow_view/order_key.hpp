#ifndef ORDER_KEY_HPP
#define ORDER_KEY_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "flow.hpp"

class View;

// Sort value produced by an order key. A given key always produces the same
// alternative, so comparisons between values of one key never mix kinds.
using OrderValue = std::variant<uint64_t, std::string>;

// Opaque process-unique token identifying one OrderKey instance. It names the
// key's slot in the per-flow order cache.
using OrderKeyToken = uint64_t;

std::string to_string(const OrderValue& value);

// A named, cache-aware sort key extractor bound to one View.
//
// The view's sorted index assumes that the value a flow was placed with does
// not change while it is indexed. Values such as the transferred size grow
// during a flow's lifetime, so the key caches the value in the flow's
// settings and refresh() repositions the flow when the fresh value differs.
class OrderKey
{
   public:
    OrderKey(View& view, std::string name);
    virtual ~OrderKey() = default;

    OrderKey(const OrderKey&) = delete;
    OrderKey& operator=(const OrderKey&) = delete;

    const std::string& name() const { return m_name; }
    OrderKeyToken token() const { return m_token; }

    // Pure function of the flow's current state. May be expensive.
    virtual OrderValue generate(const Flow& flow) const = 0;

    // Cached value for a stored flow, computing and caching it on first use.
    // Flows absent from the store are computed and not cached.
    OrderValue value(const FlowPtr& flow) const;

    // Recomputes the value of an indexed flow and, if it changed, moves the
    // flow to its new position and emits a view refresh.
    void refresh(const FlowPtr& flow);

   protected:
    View& m_view;

   private:
    std::string m_name;
    OrderKeyToken m_token;
};

// Request start time, 0 when unknown
class OrderRequestStart : public OrderKey
{
   public:
    explicit OrderRequestStart(View& view) : OrderKey(view, "time") {}
    OrderValue generate(const Flow& flow) const override;
};

class OrderRequestMethod : public OrderKey
{
   public:
    explicit OrderRequestMethod(View& view) : OrderKey(view, "method") {}
    OrderValue generate(const Flow& flow) const override;
};

class OrderRequestUrl : public OrderKey
{
   public:
    explicit OrderRequestUrl(View& view) : OrderKey(view, "url") {}
    OrderValue generate(const Flow& flow) const override;
};

// Request plus response content length, absent content counts as 0
class OrderKeySize : public OrderKey
{
   public:
    explicit OrderKeySize(View& view) : OrderKey(view, "size") {}
    OrderValue generate(const Flow& flow) const override;
};

#endif  // ORDER_KEY_HPP

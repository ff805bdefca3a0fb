#ifndef FLOW_FILTER_HPP
#define FLOW_FILTER_HPP

#include <functional>
#include <optional>
#include <string>

#include "flow.hpp"

using FlowFilter = std::function<bool(const Flow&)>;

// Filter that accepts every flow
FlowFilter match_all();

// Abstract interface for turning filter text into a predicate
class FilterParser
{
   public:
    virtual ~FilterParser() = default;

    // Returns std::nullopt if the expression is not valid
    virtual std::optional<FlowFilter> parse(const std::string& text) const = 0;
};

// Small filter language:
//
//   expr   := conj ( "|" conj )*
//   conj   := term+                      (all terms must match)
//   term   := ["!"] atom
//   atom   := "." | "~a" | "~marked" | "~s" | "~q" | "~e"
//           | "~m" METHOD | "~u" TEXT | "~d" TEXT | "~c" CODE
//
// ~m compares the request method case-insensitively, ~u and ~d match a
// substring of the URL and host, ~c the response status, ~s/~q select flows
// with/without a response, ~e flows with an error.
class SimpleFilterParser : public FilterParser
{
   public:
    SimpleFilterParser() = default;
    ~SimpleFilterParser() override = default;

    std::optional<FlowFilter> parse(const std::string& text) const override;
};

#endif  // FLOW_FILTER_HPP

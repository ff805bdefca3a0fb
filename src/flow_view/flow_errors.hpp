#ifndef FLOW_ERRORS_HPP
#define FLOW_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class of every caller-input error raised by the view components.
// None of these are retried internally; the operation that raised it has
// not changed any state for the offending record.
class FlowViewError : public std::runtime_error
{
   public:
    explicit FlowViewError(const std::string& what) : std::runtime_error(what) {}
};

// Filter text that the filter parser rejected
class InvalidFilterExpression : public FlowViewError
{
   public:
    explicit InvalidFilterExpression(const std::string& expr)
        : FlowViewError("Invalid flow filter: " + expr), m_expression(expr)
    {
    }

    const std::string& expression() const { return m_expression; }

   private:
    std::string m_expression;
};

// Order name that does not match any registered order key
class UnknownOrderName : public FlowViewError
{
   public:
    explicit UnknownOrderName(const std::string& name)
        : FlowViewError("Unknown flow order: " + name), m_name(name)
    {
    }

    const std::string& name() const { return m_name; }

   private:
    std::string m_name;
};

class OutOfBounds : public FlowViewError
{
   public:
    explicit OutOfBounds(const std::string& what) : FlowViewError(what) {}
};

class FocusNotInView : public FlowViewError
{
   public:
    FocusNotInView() : FlowViewError("Attempt to set focus to flow not in view") {}
};

// Settings requested for a flow id the store does not hold
class UnknownIdAccess : public FlowViewError
{
   public:
    explicit UnknownIdAccess(const std::string& id)
        : FlowViewError("No flow with id " + id + " in store"), m_id(id)
    {
    }

    const std::string& id() const { return m_id; }

   private:
    std::string m_id;
};

#endif  // FLOW_ERRORS_HPP

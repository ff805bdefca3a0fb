#ifndef FLOW_FOCUS_HPP
#define FLOW_FOCUS_HPP

#include <optional>

#include "flow.hpp"
#include "signal.hpp"

class View;

// Tracks the current flow within a View.
//
// The focus is either empty or a flow the view currently shows. It follows
// the view's signals: when the focused flow leaves the view, the focus moves
// to the flow now occupying the nearest displayed position.
class FlowFocus
{
   public:
    explicit FlowFocus(View& view);
    ~FlowFocus();

    FlowFocus(const FlowFocus&) = delete;
    FlowFocus& operator=(const FlowFocus&) = delete;

    const FlowPtr& flow() const { return m_flow; }

    // Throws FocusNotInView unless flow is null or shown by the view
    void setFlow(const FlowPtr& flow);

    // Displayed offset of the focused flow
    std::optional<size_t> index() const;

    // Throws OutOfBounds outside [0, view size - 1]
    void setIndex(long long index);

    // Emitted after every focus assignment
    Signal<> sigChange;

   private:
    size_t nearest(const FlowPtr& flow) const;

    void onViewAdd(const FlowPtr& flow);
    void onViewRemove(const FlowPtr& flow);
    void onViewRefresh();

    View& m_view;
    FlowPtr m_flow;
    Signal<const FlowPtr&>::Connection m_add_conn;
    Signal<const FlowPtr&>::Connection m_remove_conn;
    Signal<>::Connection m_refresh_conn;
};

#endif  // FLOW_FOCUS_HPP

#ifndef FLOW_EVENT_HPP
#define FLOW_EVENT_HPP

#include "flow.hpp"

enum class FlowEventKind
{
    Request,   // a new flow was seen
    Response,  // the flow's response grew or completed
    Error      // the flow ended abnormally
};

inline const char* toString(FlowEventKind kind)
{
    switch (kind)
    {
        case FlowEventKind::Request:
            return "request";
        case FlowEventKind::Response:
            return "response";
        case FlowEventKind::Error:
            return "error";
        default:
            return "unknown";
    }
}

// Producer-side notification about one flow. `flow` is a snapshot owned by
// the event, carrying the id of the flow it describes, so it can cross from
// a capture thread to the thread that owns the View.
struct FlowEvent
{
    FlowEventKind kind;
    FlowPtr flow;
};

#endif  // FLOW_EVENT_HPP

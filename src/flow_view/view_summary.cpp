#include "view_summary.hpp"

#include "flow_view.hpp"
#include "logger.hpp"

ViewSummary ViewSummary::compute(const View& view)
{
    ViewSummary summary;
    summary.displayed = view.size();
    summary.stored = view.storeCount();

    for (const auto& flow : view.shown())
    {
        if (flow->marked)
        {
            summary.marked++;
        }
        if (flow->error)
        {
            summary.errored++;
        }
        else if (flow->response)
        {
            summary.answered++;
        }
        else
        {
            summary.awaiting++;
        }
    }
    return summary;
}

void ViewSummary::printSummary(const View& view)
{
    ViewSummary summary = compute(view);

    LOG_INFO("=== FLOW VIEW ===");
    LOG_INFO("Order: " << view.orderKey().name() << (view.reversed() ? " (reversed)" : ""));
    LOG_INFO("Flows displayed: " << summary.displayed << " of " << summary.stored << " stored");
    LOG_INFO("Marked: " << summary.marked);
    LOG_INFO("Answered: " << summary.answered);
    LOG_INFO("Awaiting response: " << summary.awaiting);
    if (summary.errored > 0)
    {
        LOG_WARNING("Flows ended with an error: " << summary.errored);
    }

    size_t position = 0;
    auto focused = view.focus().flow();
    for (const auto& flow : view.shown())
    {
        LOG_INFO((same_flow(flow, focused) ? ">" : " ") << "[" << position << "] "
                 << describe_flow(*flow));
        position++;
    }
    LOG_INFO("=================");
}

std::string describe_flow(const Flow& flow)
{
    std::string line = flow.request.method + " " + flow.request.url();
    if (flow.error)
    {
        line += " !! " + *flow.error;
    }
    else if (flow.response)
    {
        line += " -> " + std::to_string(flow.response->status_code);
        if (flow.response->raw_content)
        {
            line += " (" + std::to_string(flow.response->raw_content->size()) + " bytes)";
        }
    }
    else
    {
        line += " -> ...";
    }
    if (flow.marked)
    {
        line += " [marked]";
    }
    return line;
}

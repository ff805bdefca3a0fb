#ifndef VIEW_SUMMARY_HPP
#define VIEW_SUMMARY_HPP

#include <cstddef>
#include <string>

#include "flow.hpp"

class View;

struct ViewSummary
{
    size_t displayed{0};
    size_t stored{0};
    size_t marked{0};
    size_t answered{0};   // displayed flows with a response
    size_t awaiting{0};   // displayed flows with neither response nor error
    size_t errored{0};

    static ViewSummary compute(const View& view);

    // Logs the counters and one line per displayed flow, in display order
    static void printSummary(const View& view);
};

// One-line description of a flow: method, URL, status or error
std::string describe_flow(const Flow& flow);

#endif  // VIEW_SUMMARY_HPP

#include <catch2/catch.hpp>

#include "flow_view.hpp"
#include "test_support.hpp"
#include "view_summary.hpp"

TEST_CASE("ViewSummary counters", "[ViewSummary]")
{
    View view;
    FlowPtr answered = make_test_flow("GET", 1, 4, true);
    FlowPtr waiting = make_test_flow("GET", 2);
    FlowPtr failed = make_test_flow("POST", 3);
    failed->error = "connection reset";
    view.add({answered, waiting, failed});
    view.setFilterExpression("~m GET");

    ViewSummary summary = ViewSummary::compute(view);
    REQUIRE(summary.displayed == 2);
    REQUIRE(summary.stored == 3);
    REQUIRE(summary.marked == 1);
    REQUIRE(summary.answered == 1);
    REQUIRE(summary.awaiting == 1);
    REQUIRE(summary.errored == 0);

    SECTION("Flow descriptions")
    {
        REQUIRE(describe_flow(*answered) == "GET http://example.com/1 -> 200 (4 bytes) [marked]");
        REQUIRE(describe_flow(*waiting) == "GET http://example.com/2 -> ...");
        REQUIRE(describe_flow(*failed) == "POST http://example.com/3 !! connection reset");
    }

    SECTION("Summary marks the focused flow")
    {
        LogCapture log(LogLevel::INFO);
        ViewSummary::printSummary(view);
        REQUIRE(log.out.str().find("Flows displayed: 2 of 3 stored") != std::string::npos);
        REQUIRE(log.out.str().find(">[0] GET http://example.com/1") != std::string::npos);
        REQUIRE(log.out.str().find(" [1] GET http://example.com/2") != std::string::npos);
    }
}

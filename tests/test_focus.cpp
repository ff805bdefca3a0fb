#include <catch2/catch.hpp>

#include "flow_errors.hpp"
#include "flow_view.hpp"
#include "test_support.hpp"

TEST_CASE("Focus re-anchors when the focused flow leaves", "[FlowFocus]")
{
    View view;
    FlowPtr a = make_test_flow("GET", 1);
    FlowPtr b = make_test_flow("GET", 2);
    FlowPtr c = make_test_flow("GET", 3);
    view.add({a, b, c});
    FlowFocus& focus = view.focus();

    REQUIRE(focus.flow() == a);

    SECTION("Removing the middle flow focuses its successor")
    {
        focus.setFlow(b);
        view.remove({b});
        REQUIRE(focus.flow() == c);
        REQUIRE(focus.index() == std::optional<size_t>(1));
    }

    SECTION("Removing the last flow clamps to the new last")
    {
        focus.setFlow(c);
        view.remove({c});
        REQUIRE(focus.flow() == b);
    }

    SECTION("Reversed view uses displayed positions")
    {
        view.setReversed(true);
        focus.setFlow(b);
        REQUIRE(focus.index() == std::optional<size_t>(1));
        view.remove({b});
        // Displayed [c, a]: the flow now at position 1
        REQUIRE(focus.flow() == a);
    }

    SECTION("Removing another flow keeps the focus")
    {
        focus.setFlow(b);
        view.remove({a});
        REQUIRE(focus.flow() == b);
    }

    SECTION("Empty view clears the focus")
    {
        view.remove({a, b, c});
        REQUIRE(focus.flow() == nullptr);
        REQUIRE_FALSE(focus.index());

        FlowPtr d = make_test_flow("GET", 4);
        view.add({d});
        REQUIRE(focus.flow() == d);
    }

    SECTION("Refilter that hides the focused flow moves to the nearest")
    {
        focus.setFlow(b);
        view.setFilterExpression("!~u /2");
        REQUIRE(focus.flow() == c);

        view.setFilterExpression("~u /1");
        REQUIRE(focus.flow() == a);

        view.setFilterExpression("~u /nothing");
        REQUIRE(focus.flow() == nullptr);

        view.setFilterExpression("");
        REQUIRE(focus.flow() == a);
    }

    SECTION("Filtering the focused flow out via update")
    {
        focus.setFlow(a);
        view.setFilterExpression("~m GET");
        a->request.method = "POST";
        view.update({a});
        REQUIRE(focus.flow() == b);
    }
}

TEST_CASE("Focus assignment errors", "[FlowFocus]")
{
    View view;
    FlowPtr a = make_test_flow("GET", 1);
    FlowPtr b = make_test_flow("POST", 2);
    view.add({a, b});
    view.setFilterExpression("~m GET");
    FlowFocus& focus = view.focus();

    int changes = 0;
    focus.sigChange.connect([&changes] { changes++; });

    SECTION("Flow not in view")
    {
        REQUIRE_THROWS_AS(focus.setFlow(b), FocusNotInView);
        REQUIRE_THROWS_AS(focus.setFlow(make_test_flow("GET", 3)), FocusNotInView);
        REQUIRE(focus.flow() == a);
        REQUIRE(changes == 0);
    }

    SECTION("Index out of bounds")
    {
        REQUIRE_THROWS_AS(focus.setIndex(1), OutOfBounds);
        REQUIRE_THROWS_AS(focus.setIndex(-1), OutOfBounds);
        focus.setIndex(0);
        REQUIRE(focus.flow() == a);
        REQUIRE(changes == 1);
    }

    SECTION("Clearing is always allowed")
    {
        focus.setFlow(nullptr);
        REQUIRE(focus.flow() == nullptr);
        REQUIRE(changes == 1);
    }
}

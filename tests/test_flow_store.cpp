#include <catch2/catch.hpp>

#include "flow_store.hpp"
#include "test_support.hpp"

TEST_CASE("FlowStore Tests", "[FlowStore]")
{
    FlowStore store;
    FlowPtr a = make_test_flow("GET", 1);
    FlowPtr b = make_test_flow("GET", 2);
    FlowPtr c = make_test_flow("GET", 3);

    SECTION("Initial State")
    {
        REQUIRE(store.empty());
        REQUIRE(store.get(a->id()) == nullptr);
        REQUIRE(store.sequence(a->id()) == 0);
    }

    SECTION("Put keeps insertion order")
    {
        REQUIRE(store.put(b));
        REQUIRE(store.put(a));
        REQUIRE(store.put(c));
        REQUIRE(ids_of(store.all()) == ids_of({b, a, c}));
        REQUIRE(store.sequence(b->id()) < store.sequence(a->id()));
        REQUIRE(store.sequence(a->id()) < store.sequence(c->id()));
    }

    SECTION("Duplicate ids are ignored")
    {
        REQUIRE(store.put(a));
        auto same_id = std::make_shared<Flow>(a->id());
        REQUIRE_FALSE(store.put(same_id));
        REQUIRE(store.size() == 1);
        REQUIRE(store.get(a->id()) == a);
    }

    SECTION("Erase and clear")
    {
        store.put(a);
        store.put(b);
        REQUIRE(store.erase(a->id()));
        REQUIRE_FALSE(store.erase(a->id()));
        REQUIRE_FALSE(store.contains(a->id()));
        REQUIRE(store.contains(b->id()));

        // A re-added flow sorts after everything present
        store.put(a);
        REQUIRE(store.sequence(a->id()) > store.sequence(b->id()));

        store.clear();
        REQUIRE(store.empty());
        REQUIRE(store.all().empty());
    }
}

#include <catch2/catch.hpp>

#include <stdexcept>

#include "flow_errors.hpp"
#include "view_commands.hpp"
#include "test_support.hpp"

namespace
{

class FakeReader : public FlowReader
{
   public:
    std::vector<FlowPtr> read(const std::string& path) override
    {
        if (path == "missing")
        {
            throw std::runtime_error("cannot open " + path);
        }
        reads++;
        return flows;
    }

    const char* getFormatName() const override { return "fake"; }

    std::vector<FlowPtr> flows;
    int reads{0};
};

}  // namespace

TEST_CASE("ViewCommands navigation", "[ViewCommands]")
{
    View view;
    ViewCommands commands(view);

    SECTION("go on an empty view is a no-op")
    {
        commands.go(-1);
        commands.go(3);
        REQUIRE(view.focus().flow() == nullptr);
    }

    std::vector<FlowPtr> flows;
    for (uint64_t t = 1; t <= 5; ++t)
    {
        flows.push_back(make_test_flow("GET", t));
    }
    view.add(flows);

    SECTION("go with negative and clamped offsets")
    {
        commands.go(-1);
        REQUIRE(view.focus().flow() == flows[4]);
        commands.go(2);
        REQUIRE(view.focus().flow() == flows[2]);
        commands.go(100);
        REQUIRE(view.focus().flow() == flows[4]);
        commands.go(-100);
        REQUIRE(view.focus().flow() == flows[0]);
    }

    SECTION("focusNext and focusPrev stop at the ends")
    {
        commands.focusPrev();
        REQUIRE(view.focus().flow() == flows[0]);
        commands.focusNext();
        commands.focusNext();
        REQUIRE(view.focus().flow() == flows[2]);
        commands.go(-1);
        commands.focusNext();
        REQUIRE(view.focus().flow() == flows[4]);
        commands.focusPrev();
        REQUIRE(view.focus().flow() == flows[3]);
    }

    SECTION("Order options and marked toggle")
    {
        REQUIRE(commands.orderOptions() == view.orderOptions());
        flows[1]->marked = true;
        commands.toggleMarked();
        REQUIRE(ids_of(view.shown()) == ids_of({flows[1]}));
        REQUIRE(view.focus().flow() == flows[1]);
    }
}

TEST_CASE("ViewCommands settings values", "[ViewCommands]")
{
    View view;
    std::vector<std::vector<FlowPtr>> notified;
    ViewCommands commands(view, [&notified](const std::vector<FlowPtr>& flows) {
        notified.push_back(flows);
    });
    FlowPtr a = make_test_flow("GET", 1);
    FlowPtr b = make_test_flow("GET", 2);
    view.add({a, b});

    SECTION("set and get")
    {
        commands.setValue({a, b}, "colour", "red");
        REQUIRE(commands.getValue(a, "colour", "none") == "red");
        REQUIRE(commands.getValue(b, "size", "none") == "none");
        REQUIRE(notified.size() == 1);
        REQUIRE(ids_of(notified[0]) == ids_of({a, b}));
    }

    SECTION("toggle uses the given key")
    {
        commands.setValueToggle({a}, "intercept");
        REQUIRE(commands.getValue(a, "intercept", "") == "true");
        REQUIRE(commands.getValue(a, "key", "unset") == "unset");

        commands.setValueToggle({a, b}, "intercept");
        REQUIRE(commands.getValue(a, "intercept", "") == "false");
        REQUIRE(commands.getValue(b, "intercept", "") == "true");
        REQUIRE(notified.size() == 2);
    }

    SECTION("Values for flows outside the store are rejected")
    {
        FlowPtr stranger = make_test_flow("GET", 3);
        REQUIRE_THROWS_AS(commands.getValue(stranger, "k", ""), UnknownIdAccess);
        REQUIRE_THROWS_AS(commands.setValue({stranger}, "k", "v"), UnknownIdAccess);
        REQUIRE(notified.empty());
    }
}

TEST_CASE("ViewCommands adding flows", "[ViewCommands]")
{
    View view;
    ViewCommands commands(view);

    SECTION("load adds fresh copies every time")
    {
        FakeReader reader;
        reader.flows = {make_test_flow("GET", 1), make_test_flow("POST", 2)};

        LogCapture log(LogLevel::INFO);
        REQUIRE(commands.load(reader, "dump") == 2);
        REQUIRE(commands.load(reader, "dump") == 2);

        REQUIRE(view.storeCount() == 4);
        REQUIRE(view.getById(reader.flows[0]->id()) == nullptr);
        REQUIRE(log.out.str().find("Loaded 2 flows from dump") != std::string::npos);

        REQUIRE_THROWS_AS(commands.load(reader, "missing"), std::runtime_error);
        REQUIRE(view.storeCount() == 4);
    }

    SECTION("duplicate focuses the first copy")
    {
        FlowPtr a = make_test_flow("GET", 1);
        FlowPtr b = make_test_flow("GET", 2);
        view.add({a, b});

        LogCapture log(LogLevel::INFO);
        commands.duplicate({b, a});

        REQUIRE(view.storeCount() == 4);
        FlowPtr focused = view.focus().flow();
        REQUIRE(focused->id() != b->id());
        REQUIRE(focused->request.url() == b->request.url());
        REQUIRE(log.out.str().find("Duplicated 2 flows") != std::string::npos);
    }

    SECTION("duplicate skips null entries")
    {
        FlowPtr a = make_test_flow("GET", 1);
        view.add({a});

        commands.duplicate({nullptr, a});
        REQUIRE(view.storeCount() == 2);
        REQUIRE(view.focus().flow()->id() != a->id());

        commands.duplicate({nullptr});
        REQUIRE(view.storeCount() == 2);
    }

    SECTION("duplicate of a hidden flow keeps the focus")
    {
        FlowPtr a = make_test_flow("GET", 1);
        view.add({a});
        view.setFilterExpression("~m GET");
        FlowPtr post = make_test_flow("POST", 2);
        view.add({post});

        commands.duplicate({post});
        REQUIRE(view.storeCount() == 3);
        REQUIRE(view.focus().flow() == a);
    }

    SECTION("create, resolve and remove")
    {
        FlowPtr created = commands.create("get", "https://example.com/new");
        REQUIRE(view.contains(created));
        REQUIRE(created->request.method == "GET");
        REQUIRE(ids_of(commands.resolve("~u /new")) == ids_of({created}));

        commands.remove(commands.resolve("@all"));
        REQUIRE(view.storeCount() == 0);

        REQUIRE_THROWS_AS(commands.create("GET", "not a url"), FlowViewError);
    }
}

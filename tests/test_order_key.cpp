#include <catch2/catch.hpp>

#include "flow_errors.hpp"
#include "flow_view.hpp"
#include "test_support.hpp"

namespace
{

uint64_t size_of(const FlowPtr& flow)
{
    return flow->response && flow->response->raw_content ? flow->response->raw_content->size() : 0;
}

std::vector<uint64_t> shown_sizes(const View& view)
{
    std::vector<uint64_t> out;
    for (const auto& flow : view.shown())
    {
        out.push_back(size_of(flow));
    }
    return out;
}

class OrderByHost : public OrderKey
{
   public:
    explicit OrderByHost(View& view) : OrderKey(view, "host") {}
    OrderValue generate(const Flow& flow) const override { return OrderValue(flow.request.host); }
};

}  // namespace

TEST_CASE("Order keys reposition changed flows", "[OrderKey]")
{
    View view;
    view.setOrder("size");
    FlowPtr f10 = make_test_flow("GET", 1, 10);
    FlowPtr f5 = make_test_flow("GET", 2, 5);
    FlowPtr f20 = make_test_flow("GET", 3, 20);
    view.add({f10, f5, f20});

    REQUIRE(shown_sizes(view) == std::vector<uint64_t>{5, 10, 20});

    SECTION("Growth moves the flow and refreshes the cache")
    {
        SignalRecorder recorder(view);
        f10->response->raw_content = std::string(30, 'x');
        view.update({f10});

        REQUIRE(shown_sizes(view) == std::vector<uint64_t>{5, 20, 30});
        REQUIRE(view.order("size").value(f10) == OrderValue(uint64_t{30}));
        REQUIRE(recorder.count("refresh") == 1);
        REQUIRE(recorder.count("update:" + f10->id()) == 1);
    }

    SECTION("Unchanged value keeps the position without refresh")
    {
        SignalRecorder recorder(view);
        view.update({f10});
        REQUIRE(shown_sizes(view) == std::vector<uint64_t>{5, 10, 20});
        REQUIRE(recorder.count("refresh") == 0);
        REQUIRE(recorder.count("update:") == 1);
    }

    SECTION("Inactive key only updates its cache")
    {
        OrderKey& time = view.order("time");
        REQUIRE(time.value(f10) == OrderValue(uint64_t{1}));

        SignalRecorder recorder(view);
        f10->request.timestamp_start_ms = 99;
        time.refresh(f10);
        REQUIRE(time.value(f10) == OrderValue(uint64_t{99}));
        REQUIRE(recorder.events.empty());
        REQUIRE(shown_sizes(view) == std::vector<uint64_t>{5, 10, 20});
    }

    SECTION("Flows outside the store are computed, not cached")
    {
        FlowPtr stranger = make_test_flow("GET", 4, 7);
        REQUIRE(view.orderKey().value(stranger) == OrderValue(uint64_t{7}));
        REQUIRE_FALSE(view.settings().contains(stranger->id()));
    }

    SECTION("Switching order re-sorts the displayed sequence")
    {
        view.setOrder("time");
        REQUIRE(ids_of(view.shown()) == ids_of({f10, f5, f20}));
    }
}

TEST_CASE("Order key registry", "[OrderKey]")
{
    View view;

    SECTION("Built-in keys")
    {
        REQUIRE(view.orderOptions() == std::vector<std::string>{"method", "size", "time", "url"});
        REQUIRE(view.orderKey().name() == "time");
        REQUIRE_THROWS_AS(view.order("nope"), UnknownOrderName);
        REQUIRE_THROWS_AS(view.setOrder("nope"), UnknownOrderName);
        REQUIRE(view.orderKey().name() == "time");
    }

    SECTION("Tokens are distinct per key")
    {
        REQUIRE(view.order("time").token() != view.order("size").token());
    }

    SECTION("Custom key")
    {
        FlowPtr b = make_test_flow("GET", 1);
        b->request.host = "b.example";
        FlowPtr a = make_test_flow("GET", 2);
        a->request.host = "a.example";
        view.add({b, a});

        view.registerOrder(std::make_unique<OrderByHost>(view));
        REQUIRE(view.orderOptions().size() == 5);
        view.setOrder("host");
        REQUIRE(ids_of(view.shown()) == ids_of({a, b}));
    }

    SECTION("Replacing a key drops its cached values")
    {
        FlowPtr b = make_test_flow("GET", 1);
        b->request.host = "b.example";
        FlowPtr a = make_test_flow("GET", 2);
        a->request.host = "a.example";
        view.add({b, a});
        view.registerOrder(std::make_unique<OrderByHost>(view));
        view.setOrder("host");

        const OrderKeyToken old_token = view.order("host").token();
        REQUIRE(view.settings().findOrderCache(a->id())->count(old_token) == 1);

        view.registerOrder(std::make_unique<OrderByHost>(view));
        const OrderKeyToken new_token = view.orderKey().token();
        REQUIRE(new_token != old_token);
        REQUIRE(view.orderKey().name() == "host");
        for (const FlowPtr& flow : {a, b})
        {
            const OrderCache* cache = view.settings().findOrderCache(flow->id());
            REQUIRE(cache->count(old_token) == 0);
            REQUIRE(cache->count(new_token) == 1);
        }
        REQUIRE(ids_of(view.shown()) == ids_of({a, b}));
    }

    SECTION("A null key is ignored")
    {
        view.registerOrder(nullptr);
        REQUIRE(view.orderOptions().size() == 4);
    }

    SECTION("Equal values keep insertion order")
    {
        FlowPtr first = make_test_flow("GET", 5);
        FlowPtr second = make_test_flow("GET", 5);
        FlowPtr third = make_test_flow("GET", 5);
        view.add({first, second, third});
        REQUIRE(ids_of(view.shown()) == ids_of({first, second, third}));

        view.setReversed(true);
        REQUIRE(ids_of(view.shown()) == ids_of({third, second, first}));
    }

    SECTION("Method and url keys order text")
    {
        FlowPtr post = make_test_flow("POST", 1);
        FlowPtr get = make_test_flow("GET", 2);
        view.add({post, get});
        view.setOrder("method");
        REQUIRE(ids_of(view.shown()) == ids_of({get, post}));
        view.setOrder("url");
        // "/1" sorts before "/2"
        REQUIRE(ids_of(view.shown()) == ids_of({post, get}));
    }

    SECTION("Value text form")
    {
        REQUIRE(to_string(OrderValue(uint64_t{42})) == "42");
        REQUIRE(to_string(OrderValue(std::string("GET"))) == "GET");
    }
}

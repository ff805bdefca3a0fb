#include <catch2/catch.hpp>

#include <set>

#include "flow.hpp"
#include "flow_errors.hpp"

TEST_CASE("Flow identity", "[Flow]")
{
    SECTION("Generated ids are unique version 4 UUIDs")
    {
        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i)
        {
            Flow flow;
            REQUIRE(flow.id().size() == 36);
            REQUIRE(flow.id()[14] == '4');
            REQUIRE(flow.id()[8] == '-');
            ids.insert(flow.id());
        }
        REQUIRE(ids.size() == 100);
    }

    SECTION("Explicit id is kept")
    {
        Flow flow("abc");
        REQUIRE(flow.id() == "abc");
    }

    SECTION("same_flow compares ids, not instances")
    {
        auto a = std::make_shared<Flow>("x");
        auto b = std::make_shared<Flow>("x");
        auto c = std::make_shared<Flow>("y");
        REQUIRE(same_flow(a, b));
        REQUIRE_FALSE(same_flow(a, c));
        REQUIRE_FALSE(same_flow(a, nullptr));
    }
}

TEST_CASE("Flow::make", "[Flow]")
{
    SECTION("Parses scheme, host, port and path")
    {
        FlowPtr flow = Flow::make("get", "http://example.com:8080/a/b?c=d");
        REQUIRE(flow->request.method == "GET");
        REQUIRE(flow->request.scheme == "http");
        REQUIRE(flow->request.host == "example.com");
        REQUIRE(flow->request.port == 8080);
        REQUIRE(flow->request.path == "/a/b?c=d");
        REQUIRE(flow->request.url() == "http://example.com:8080/a/b?c=d");
        REQUIRE(flow->request.header("host") == std::optional<std::string>("example.com"));
        REQUIRE(flow->server.address == "example.com");
        REQUIRE(flow->server.port == 8080);
        REQUIRE_FALSE(flow->response);
    }

    SECTION("Default ports and path")
    {
        FlowPtr https = Flow::make("POST", "https://example.org");
        REQUIRE(https->request.port == 443);
        REQUIRE(https->request.path == "/");
        REQUIRE(https->request.url() == "https://example.org/");
    }

    SECTION("Bracketed IPv6 host")
    {
        FlowPtr flow = Flow::make("GET", "http://[::1]:8000/x");
        REQUIRE(flow->request.host == "::1");
        REQUIRE(flow->request.port == 8000);
    }

    SECTION("Invalid URLs are rejected")
    {
        REQUIRE_THROWS_AS(Flow::make("GET", "example.com/x"), FlowViewError);
        REQUIRE_THROWS_AS(Flow::make("GET", "ftp://example.com/"), FlowViewError);
        REQUIRE_THROWS_AS(Flow::make("GET", "http://:80/"), FlowViewError);
        REQUIRE_THROWS_AS(Flow::make("GET", "http://example.com:99999/"), FlowViewError);
        REQUIRE_THROWS_AS(Flow::make("GET", "http://example.com:abc/"), FlowViewError);
    }
}

TEST_CASE("Flow copy and kill", "[Flow]")
{
    SECTION("Copy has a fresh id and is not killable")
    {
        FlowPtr flow = Flow::make("GET", "http://example.com/");
        flow->marked = true;
        flow->setKillHook([] {});
        FlowPtr dup = flow->copy();
        REQUIRE(dup->id() != flow->id());
        REQUIRE(dup->request.url() == flow->request.url());
        REQUIRE(dup->marked);
        REQUIRE_FALSE(dup->killable());
    }

    SECTION("Kill invokes the hook once and records the error")
    {
        int calls = 0;
        Flow flow;
        REQUIRE_FALSE(flow.killable());
        flow.setKillHook([&calls] { calls++; });
        REQUIRE(flow.killable());

        flow.kill();
        REQUIRE(calls == 1);
        REQUIRE(flow.error == std::optional<std::string>("killed"));
        REQUIRE_FALSE(flow.killable());

        flow.kill();
        REQUIRE(calls == 1);
    }
}

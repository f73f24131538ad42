#include <catch2/catch_test_macros.hpp>
#include <herald/http/http_common.hpp>

using namespace herald::http;

TEST_CASE("HTTP method conversion", "[http][method]") {
    REQUIRE(method_to_string(method::GET) == "GET");
    REQUIRE(method_to_string(method::DELETE_) == "DELETE");
    REQUIRE(method_to_string(method::OPTIONS) == "OPTIONS");
}

TEST_CASE("HTTP status codes and reasons", "[http][status]") {
    REQUIRE(status_code(status::ok) == 200);
    REQUIRE(status_code(status::bad_request) == 400);
    REQUIRE(status_code(status::method_not_allowed) == 405);
    REQUIRE(status_code(status::service_unavailable) == 503);

    REQUIRE(status_reason(status::not_found) == "Not Found");
    REQUIRE(status_reason(status::unauthorized) == "Unauthorized");
    REQUIRE(status_reason(status::too_many_requests) == "Too Many Requests");
}

TEST_CASE("HTTP headers", "[http][headers]") {
    SECTION("case-insensitive lookup") {
        headers h;
        h.set("Last-Event-ID", "42");

        REQUIRE(h.get("last-event-id") == "42");
        REQUIRE(h.get("LAST-EVENT-ID") == "42");
        REQUIRE(h.contains("Last-Event-Id"));
        REQUIRE(h.get("Missing").empty());
    }

    SECTION("set overwrites") {
        headers h;
        h.set("Cache-Control", "no-store");
        h.set("cache-control", "no-cache");

        REQUIRE(h.size() == 1);
        REQUIRE(h.get("Cache-Control") == "no-cache");
    }

    SECTION("initializer list and remove") {
        headers h{
            {"Content-Type", mime::text_event_stream},
            {"Connection", "keep-alive"},
        };
        REQUIRE(h.size() == 2);
        REQUIRE(h.get("content-type") == "text/event-stream");

        h.remove("CONNECTION");
        REQUIRE(h.size() == 1);
        REQUIRE_FALSE(h.contains("Connection"));
    }

    SECTION("iteration") {
        headers h{{"A", "1"}, {"B", "2"}};
        size_t count = 0;
        for (const auto& [name, value] : h) {
            REQUIRE(h.get(name) == value);
            ++count;
        }
        REQUIRE(count == 2);
        REQUIRE_FALSE(h.empty());
    }
}

TEST_CASE("request target split", "[http][target]") {
    auto t = target::split("/sse?channel_id=1&x=2");
    REQUIRE(t.path == "/sse");
    REQUIRE(t.query == "channel_id=1&x=2");

    auto bare = target::split("/sse");
    REQUIRE(bare.path == "/sse");
    REQUIRE(bare.query.empty());

    auto empty_query = target::split("/sse?");
    REQUIRE(empty_query.path == "/sse");
    REQUIRE(empty_query.query.empty());
}

TEST_CASE("URL decoding", "[http][url]") {
    REQUIRE(url_decode("hello%20world") == "hello world");
    REQUIRE(url_decode("a+b") == "a b");
    REQUIRE(url_decode("%2Fpath%2f") == "/path/");
    REQUIRE(url_decode("100%") == "100%");
    REQUIRE(url_decode("%4") == "%4");
    REQUIRE(url_decode("%zz") == "%zz");
    REQUIRE(url_decode("") == "");
}

TEST_CASE("query string parsing", "[http][query]") {
    SECTION("basic pairs") {
        auto params = parse_query_string("channel_id=room%201&token=abc");
        REQUIRE(params.size() == 2);
        REQUIRE(params["channel_id"] == "room 1");
        REQUIRE(params["token"] == "abc");
    }

    SECTION("key without value") {
        auto params = parse_query_string("flag&x=1");
        REQUIRE(params.contains("flag"));
        REQUIRE(params["flag"].empty());
        REQUIRE(params["x"] == "1");
    }

    SECTION("first value of a repeated key wins") {
        auto params = parse_query_string("channel_id=a&channel_id=b");
        REQUIRE(params["channel_id"] == "a");
    }

    SECTION("empty segments are skipped") {
        auto params = parse_query_string("&&x=1&");
        REQUIRE(params.size() == 1);
        REQUIRE(params["x"] == "1");
    }

    SECTION("empty value is kept") {
        auto params = parse_query_string("channel_id=");
        REQUIRE(params.contains("channel_id"));
        REQUIRE(params["channel_id"].empty());
    }
}

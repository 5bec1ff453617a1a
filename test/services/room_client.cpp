//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_client.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json/error.hpp>
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "credential_store.hpp"
#include "error.hpp"
#include "services/session_manager.hpp"
#include "test_utils.hpp"

using namespace rcfacade;
using namespace rcfacade::test;
namespace http = boost::beast::http;

BOOST_AUTO_TEST_SUITE(room_client_)

struct fixture
{
    boost::asio::io_context ctx;
    stub_http_client http;
    credential_store store{make_config()};
    session_manager sessions{store, http};
    room_client rooms{store, sessions, http};

    // Most tests start with a valid session
    void authenticate() { store.store_session(session{"tok1", "u1"}); }
};

BOOST_FIXTURE_TEST_CASE(list_public_channels, fixture)
{
    authenticate();
    http.add_response(200, R"({
        "channels": [
            {"_id": "R1", "name": "general", "t": "c", "ts": "2023-11-01T10:00:00.000Z"},
            {"_id": "R2", "name": "random", "t": "c"}
        ],
        "count": 2,
        "success": true
    })");

    auto res = run_coro(ctx, rooms.list_public_channels());

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST_REQUIRE(res->size() == 2u);
    BOOST_TEST(res->at(0).id == "R1");
    BOOST_TEST(res->at(0).created_at.has_value());
    BOOST_TEST(res->at(1).name == "random");

    // Request
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    const auto& req = http.requests[0];
    BOOST_TEST(req.method == http::verb::get);
    BOOST_TEST(req.target == "/channels.list");
    BOOST_TEST(find_header(req, "X-Auth-Token") == "tok1");
    BOOST_TEST(find_header(req, "X-User-Id") == "u1");
}

BOOST_FIXTURE_TEST_CASE(authenticated_calls_dont_login, fixture)
{
    authenticate();
    http.add_response(200, R"({"channels":[]})");
    http.add_response(200, R"({"channel":{"_id":"R1"}})");

    auto res1 = run_coro(ctx, rooms.list_public_channels());
    auto res2 = run_coro(ctx, rooms.get_channel_info("R1"));

    BOOST_TEST(res1.has_value());
    BOOST_TEST(res2.has_value());
    BOOST_TEST_REQUIRE(http.requests.size() == 2u);
    BOOST_TEST(http.requests[0].target == "/channels.list");
    BOOST_TEST(http.requests[1].target == "/channels.info?roomId=R1");
}

BOOST_FIXTURE_TEST_CASE(unauthenticated_call_logs_in_first, fixture)
{
    http.add_response(200, login_response_body("tok9", "u9"));
    http.add_response(200, R"({"channels":[]})");
    http.add_response(200, R"({"channels":[]})");

    auto res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.has_value());

    // A second call reuses the session
    res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.has_value());

    BOOST_TEST_REQUIRE(http.requests.size() == 3u);
    BOOST_TEST(http.requests[0].target == "/login");
    BOOST_TEST(http.requests[1].target == "/channels.list");
    BOOST_TEST(find_header(http.requests[1], "X-Auth-Token") == "tok9");
    BOOST_TEST(find_header(http.requests[1], "X-User-Id") == "u9");
    BOOST_TEST(http.requests[2].target == "/channels.list");
}

BOOST_FIXTURE_TEST_CASE(login_failure_propagates, fixture)
{
    http.add_response(401, R"({"status":"error","message":"Unauthorized"})");

    auto res = run_coro(ctx, rooms.list_public_channels());

    // The login error is reported as such, and the resource call is not made
    BOOST_TEST(res.error().ec == error_code(errc::authentication_failed));
    BOOST_TEST(http.requests.size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(list_public_channels_errors, fixture)
{
    authenticate();

    // Non-2xx
    http.add_response(500, "Internal error");
    auto res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.error().ec == error_code(errc::channel_list_failed));
    BOOST_TEST(res.error().msg == "HTTP 500: Internal error");

    // Transport failure
    http.add_error({boost::asio::error::timed_out, "Reading upstream response"});
    res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.error().ec == error_code(errc::channel_list_failed));
    BOOST_TEST(res.error().msg.starts_with("Transport failure: "));

    // Missing key
    http.add_response(200, R"({"success":true})");
    res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.error().ec == error_code(errc::channel_list_failed));

    // Key with the wrong type
    http.add_response(200, R"({"channels":{}})");
    res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.error().ec == error_code(errc::channel_list_failed));

    // Not JSON
    http.add_response(200, "<html></html>");
    res = run_coro(ctx, rooms.list_public_channels());
    BOOST_TEST(res.error().ec == error_code(errc::channel_list_failed));
}

BOOST_FIXTURE_TEST_CASE(create_channel, fixture)
{
    authenticate();
    http.add_response(200, R"({"channel":{"_id":"R1","name":"general","t":"c","ro":false},"success":true})");

    auto res = run_coro(ctx, rooms.create_channel("general", {}, false, ""));

    // Result
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "R1");
    BOOST_TEST(res->name == "general");
    BOOST_TEST(res->kind == "c");
    BOOST_TEST(!res->read_only);
    BOOST_TEST(!res->creator.has_value());
    BOOST_TEST(res->topic == "");
    BOOST_TEST(res->description == "");
    BOOST_TEST(!res->is_default);
    BOOST_TEST(!res->created_at.has_value());
    BOOST_TEST(!res->updated_at.has_value());

    // Request
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    const auto& req = http.requests[0];
    BOOST_TEST(req.method == http::verb::post);
    BOOST_TEST(req.target == "/channels.create");
    BOOST_TEST(req.content_type == "application/json");
    BOOST_TEST(parse_json(req.body) == parse_json(R"({"name":"general","members":[],"readOnly":false})"));
}

BOOST_FIXTURE_TEST_CASE(create_channel_with_members, fixture)
{
    authenticate();
    http.add_response(200, R"({"channel":{"_id":"R2","name":"team","ro":true}})");
    const std::vector<std::string> members{"alice", "bob"};

    auto res = run_coro(ctx, rooms.create_channel("team", members, true, "Team channel"));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->read_only);
    BOOST_TEST(
        parse_json(http.requests.at(0).body) ==
        parse_json(R"({"name":"team","members":["alice","bob"],"readOnly":true,"description":"Team channel"})")
    );
}

BOOST_FIXTURE_TEST_CASE(create_channel_errors, fixture)
{
    authenticate();

    // Upstream rejected it
    http.add_response(400, R"({"success":false,"error":"A channel with that name already exists"})");
    auto res = run_coro(ctx, rooms.create_channel("general", {}, false, ""));
    BOOST_TEST(res.error().ec == error_code(errc::channel_create_failed));
    BOOST_TEST(res.error().msg == R"(HTTP 400: {"success":false,"error":"A channel with that name already exists"})");

    // Missing key
    http.add_response(200, R"({"success":true})");
    res = run_coro(ctx, rooms.create_channel("general", {}, false, ""));
    BOOST_TEST(res.error().ec == error_code(errc::channel_create_failed));

    // Bad timestamp
    http.add_response(200, R"({"channel":{"_id":"R1","ts":"not a date"}})");
    res = run_coro(ctx, rooms.create_channel("general", {}, false, ""));
    BOOST_TEST(res.error().ec == error_code(errc::invalid_timestamp));
}

BOOST_FIXTURE_TEST_CASE(get_channel_info, fixture)
{
    authenticate();
    http.add_response(200, R"({"channel":{"_id":"R1","name":"general","u":{"_id":"U1","username":"alice"}}})");

    auto res = run_coro(ctx, rooms.get_channel_info("R1"));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "R1");
    BOOST_TEST_REQUIRE(res->creator.has_value());
    BOOST_TEST(res->creator->username == "alice");
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    BOOST_TEST(http.requests[0].method == http::verb::get);
    BOOST_TEST(http.requests[0].target == "/channels.info?roomId=R1");
}

BOOST_FIXTURE_TEST_CASE(get_channel_info_encodes_room_id, fixture)
{
    authenticate();
    http.add_response(200, R"({"channel":{"_id":"a&b"}})");

    auto res = run_coro(ctx, rooms.get_channel_info("a&b"));

    BOOST_TEST(res.has_value());
    BOOST_TEST(http.requests.at(0).target == "/channels.info?roomId=a%26b");
}

BOOST_FIXTURE_TEST_CASE(get_channel_info_errors, fixture)
{
    authenticate();

    http.add_response(404, "Not found");
    auto res = run_coro(ctx, rooms.get_channel_info("R1"));
    BOOST_TEST(res.error().ec == error_code(errc::channel_info_failed));

    http.add_response(200, R"({"room":{"_id":"R1"}})");
    res = run_coro(ctx, rooms.get_channel_info("R1"));
    BOOST_TEST(res.error().ec == error_code(errc::channel_info_failed));

    http.add_response(200, R"({"channel":{"_id":1}})");
    res = run_coro(ctx, rooms.get_channel_info("R1"));
    BOOST_TEST(res.error().ec == error_code(boost::json::error::not_string));
}

BOOST_AUTO_TEST_SUITE_END()

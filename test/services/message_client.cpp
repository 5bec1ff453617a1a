//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/test/unit_test.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "credential_store.hpp"
#include "error.hpp"
#include "services/session_manager.hpp"
#include "test_utils.hpp"

using namespace rcfacade;
using namespace rcfacade::test;
namespace http = boost::beast::http;

BOOST_AUTO_TEST_SUITE(message_client_)

struct fixture
{
    boost::asio::io_context ctx;
    stub_http_client http;
    credential_store store{make_config(session{"tok1", "u1"})};
    session_manager sessions{store, http};
    message_client messages{store, sessions, http};
};

constexpr std::string_view message_payload = R"({
    "message": {
        "_id": "M1",
        "rid": "R1",
        "msg": "hello",
        "ts": "2024-01-01T00:00:00.000Z",
        "u": {"_id": "U1", "username": "bot", "name": "Bot User"}
    },
    "success": true
})";

BOOST_FIXTURE_TEST_CASE(send_message, fixture)
{
    http.add_response(200, std::string(message_payload));

    auto res = run_coro(ctx, messages.send_message("R1", "hello"));

    // Result
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "M1");
    BOOST_TEST(res->room_id == "R1");
    BOOST_TEST(res->body == "hello");
    BOOST_TEST_REQUIRE(res->timestamp.has_value());
    BOOST_TEST(res->timestamp->time_since_epoch().count() == 1704067200000);
    BOOST_TEST_REQUIRE(res->author.has_value());
    BOOST_TEST(res->author->name == "Bot User");

    // Request
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    const auto& req = http.requests[0];
    BOOST_TEST(req.method == http::verb::post);
    BOOST_TEST(req.target == "/chat.postMessage");
    BOOST_TEST(req.content_type == "application/json");
    BOOST_TEST(parse_json(req.body) == parse_json(R"({"roomId":"R1","text":"hello"})"));
    BOOST_TEST(find_header(req, "X-Auth-Token") == "tok1");
}

BOOST_FIXTURE_TEST_CASE(send_message_errors, fixture)
{
    http.add_response(400, "bad");
    auto res = run_coro(ctx, messages.send_message("R1", "hello"));
    BOOST_TEST(res.error().ec == error_code(errc::message_send_failed));
    BOOST_TEST(res.error().msg == "HTTP 400: bad");

    http.add_response(200, R"({"success":true})");
    res = run_coro(ctx, messages.send_message("R1", "hello"));
    BOOST_TEST(res.error().ec == error_code(errc::message_send_failed));
}

BOOST_FIXTURE_TEST_CASE(send_message_with_attachment, fixture)
{
    http.add_response(200, std::string(message_payload));
    const std::vector<upload_file> files{
        {"a.txt", "text/plain", "content of file A"},
        {"b.txt", "text/plain", "content of file B"},
    };

    auto res = run_coro(ctx, messages.send_message_with_attachment("R1", "see attached", files));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "M1");

    // A single upload request, with only the first file
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    const auto& req = http.requests[0];
    BOOST_TEST(req.method == http::verb::post);
    BOOST_TEST(req.target == "/rooms.upload/R1");
    BOOST_TEST(req.content_type.starts_with("multipart/form-data; boundary="));
    BOOST_TEST(req.body.find("content of file A") != std::string::npos);
    BOOST_TEST(req.body.find("content of file B") == std::string::npos);
    BOOST_TEST(req.body.find(R"(filename="a.txt")") != std::string::npos);
    BOOST_TEST(req.body.find("see attached") != std::string::npos);
    BOOST_TEST(find_header(req, "X-User-Id") == "u1");

    // The body uses the announced boundary
    auto boundary = req.content_type.substr(std::string_view("multipart/form-data; boundary=").size());
    BOOST_TEST(req.body.starts_with("--" + boundary + "\r\n"));
    BOOST_TEST(req.body.ends_with("--" + boundary + "--\r\n"));
}

BOOST_FIXTURE_TEST_CASE(send_message_with_attachment_no_files, fixture)
{
    http.add_response(200, std::string(message_payload));

    auto res = run_coro(ctx, messages.send_message_with_attachment("R1", "hello", {}));

    BOOST_TEST(res.has_value());
    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    BOOST_TEST(http.requests[0].target == "/chat.postMessage");
}

BOOST_FIXTURE_TEST_CASE(send_message_with_attachment_errors, fixture)
{
    const std::vector<upload_file> files{
        {"a.txt", "", "abc"}
    };

    // Explicit failure
    http.add_response(200, R"({"success":false})");
    auto res = run_coro(ctx, messages.send_message_with_attachment("R1", "hello", files));
    BOOST_TEST(res.error().ec == error_code(errc::message_upload_failed));
    BOOST_TEST(res.error().msg.starts_with("Upload was not successful"));

    // No success flag
    http.add_response(200, R"({"message":{"_id":"M1"}})");
    res = run_coro(ctx, messages.send_message_with_attachment("R1", "hello", files));
    BOOST_TEST(res.error().ec == error_code(errc::message_upload_failed));

    // Success but no message
    http.add_response(200, R"({"success":true})");
    res = run_coro(ctx, messages.send_message_with_attachment("R1", "hello", files));
    BOOST_TEST(res.error().ec == error_code(errc::message_upload_failed));

    // HTTP error
    http.add_response(413, "Too large");
    res = run_coro(ctx, messages.send_message_with_attachment("R1", "hello", files));
    BOOST_TEST(res.error().ec == error_code(errc::message_upload_failed));
    BOOST_TEST(res.error().msg == "HTTP 413: Too large");
}

BOOST_FIXTURE_TEST_CASE(get_messages_default_limit, fixture)
{
    http.add_response(200, R"({
        "messages": [
            {"_id": "M2", "rid": "R1", "msg": "second"},
            {"_id": "M1", "rid": "R1", "msg": "first"}
        ],
        "success": true
    })");

    auto res = run_coro(ctx, messages.get_messages("R1"));

    // Upstream order is kept
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST_REQUIRE(res->size() == 2u);
    BOOST_TEST(res->at(0).id == "M2");
    BOOST_TEST(res->at(1).id == "M1");

    BOOST_TEST_REQUIRE(http.requests.size() == 1u);
    BOOST_TEST(http.requests[0].method == http::verb::get);
    BOOST_TEST(http.requests[0].target == "/channels.messages?roomId=R1&count=50");
}

BOOST_FIXTURE_TEST_CASE(get_messages_limit, fixture)
{
    http.add_response(200, R"({"messages":[]})");

    auto res = run_coro(ctx, messages.get_messages("R1", 10));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->empty());
    BOOST_TEST(http.requests.at(0).target == "/channels.messages?roomId=R1&count=10");
}

BOOST_FIXTURE_TEST_CASE(get_messages_errors, fixture)
{
    http.add_response(500, "error");
    auto res = run_coro(ctx, messages.get_messages("R1"));
    BOOST_TEST(res.error().ec == error_code(errc::message_list_failed));

    http.add_response(200, R"({"messages":"none"})");
    res = run_coro(ctx, messages.get_messages("R1"));
    BOOST_TEST(res.error().ec == error_code(errc::message_list_failed));

    http.add_response(200, R"({"messages":[{"_id":"M1","ts":"yesterday"}]})");
    res = run_coro(ctx, messages.get_messages("R1"));
    BOOST_TEST(res.error().ec == error_code(errc::invalid_timestamp));
}

BOOST_FIXTURE_TEST_CASE(search_messages, fixture)
{
    http.add_response(200, R"({"messages":[{"_id":"M1","rid":"R1","msg":"hello world"}]})");
    http.add_response(200, R"({"messages":[]})");

    // Without a room
    auto res = run_coro(ctx, messages.search_messages("hello"));
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST_REQUIRE(res->size() == 1u);
    BOOST_TEST(res->at(0).body == "hello world");

    // Restricted to a room
    res = run_coro(ctx, messages.search_messages("hello", std::string_view("R1")));
    BOOST_TEST_REQUIRE(res.has_value());

    BOOST_TEST_REQUIRE(http.requests.size() == 2u);
    BOOST_TEST(http.requests[0].target == "/chat.search?searchText=hello");
    BOOST_TEST(http.requests[1].target == "/chat.search?searchText=hello&roomId=R1");
}

BOOST_FIXTURE_TEST_CASE(search_messages_encodes_text, fixture)
{
    http.add_response(200, R"({"messages":[]})");

    auto res = run_coro(ctx, messages.search_messages("a&b=c"));

    BOOST_TEST(res.has_value());
    BOOST_TEST(http.requests.at(0).target == "/chat.search?searchText=a%26b%3Dc");
}

BOOST_FIXTURE_TEST_CASE(search_messages_errors, fixture)
{
    http.add_response(401, "unauthorized");
    auto res = run_coro(ctx, messages.search_messages("hello"));
    BOOST_TEST(res.error().ec == error_code(errc::search_failed));

    http.add_response(200, R"({"success":true})");
    res = run_coro(ctx, messages.search_messages("hello"));
    BOOST_TEST(res.error().ec == error_code(errc::search_failed));
}

BOOST_AUTO_TEST_SUITE_END()

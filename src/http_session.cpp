//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/url/url.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/rocketchat.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"
#include "util/path_pattern.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using namespace rcfacade;

namespace {

using handler_fn = asio::awaitable<http::message_generator> (*)(request_context&, shared_state&);

struct api_endpoint
{
    // The request path. {} segments match any value, which is made available to the handler.
    std::string_view path;

    // The request method. If several methods are allowed for the same path,
    // create several api_endpoint objects with the same path but different methods.
    http::verb method;

    // The function to invoke when a client requests this endpoint.
    handler_fn handler;
};

constexpr api_endpoint endpoints[] = {
    {"/api/rocketchat/login",               http::verb::post, handle_login          },
    {"/api/rocketchat/channels",            http::verb::get,  handle_list_channels  },
    {"/api/rocketchat/channels",            http::verb::post, handle_create_channel },
    {"/api/rocketchat/channels/{}",         http::verb::get,  handle_get_channel    },
    {"/api/rocketchat/channels/{}/messages", http::verb::get,  handle_get_messages   },
    {"/api/rocketchat/channels/{}/messages", http::verb::post, handle_send_message   },
    {"/api/rocketchat/messages/search",     http::verb::get,  handle_search_messages},
};

// Max size of a request body, in bytes. Uploads are sent inline, base64-encoded
constexpr std::size_t max_body_size = 16u * 1024u * 1024u;

asio::awaitable<http::message_generator> handle_http_request_impl(request_context& ctx, shared_state& st)
{
    using namespace std::chrono_literals;

    // Attempt to parse the request target
    auto ec = ctx.parse_request_target();
    if (ec)
        co_return ctx.response().bad_request_text("Invalid request target");

    // Normalize the URL, and split it into decoded segments
    boost::urls::url normalized(ctx.request_target());
    normalized.normalize();
    auto segs = normalized.segments();
    std::vector<std::string> segments(segs.begin(), segs.end());

    // Attempt to match one of the endpoints we have defined.
    // Since there aren't too many, linear search works better here.
    // Several endpoints may share the same path but have different methods
    handler_fn handler = nullptr;
    bool path_matched = false;
    for (const auto& endpoint : endpoints)
    {
        auto params = match_path_pattern(endpoint.path, segments);
        if (!params)
            continue;
        path_matched = true;
        if (endpoint.method == ctx.request_method())
        {
            handler = endpoint.handler;
            ctx.set_path_params(std::move(*params));
            break;
        }
    }

    // If the path didn't match, return a 404
    if (!path_matched)
        co_return ctx.response().not_found_text();

    // If we didn't find any endpoint here, it means that the method that
    // the client requested doesn't have a matching handler
    if (handler == nullptr)
        co_return ctx.response().method_not_allowed();

    // Invoke the endpoint, applying a timeout to the overall upstream interaction.
    // Using co_spawn allows us to use arbitrary completion tokens with our coroutines.
    // asio::cancel_after will issue a cancellation signal after the specified
    // deadline, making the operation fail if the deadline is exceeded.
    // co_spawn doesn't support returning arguments that are not default-constructible,
    // like http::message_generator, so we use an optional.
    std::optional<http::message_generator> gen;
    co_await asio::co_spawn(
        // Use the same executor as the current coroutine
        co_await asio::this_coro::executor,

        // The actual coroutine to run
        [handler, &gen, &ctx, &st]() -> asio::awaitable<void> { gen = co_await handler(ctx, st); },

        // Set a timeout to the overall operation
        asio::cancel_after(30s)
    );

    // If we got here, the handler finished successfully, and the optional
    // has been populated with the response.
    co_return std::move(gen).value();
}

}  // namespace

asio::awaitable<http::message_generator> rcfacade::handle_http_request(
    http::request<http::string_body>&& req,
    shared_state& st
)
{
    // Build a request context
    request_context ctx(std::move(req));

    // We don't communicate regular failures using exceptions, but
    // unhandled exceptions shouldn't crash the server.
    try
    {
        co_return co_await handle_http_request_impl(ctx, st);
    }
    catch (const std::exception& err)
    {
        co_return ctx.response().internal_server_error(errc::uncaught_exception, err.what());
    }
}

asio::awaitable<void> rcfacade::run_http_session(
    asio::ip::tcp::socket socket,
    std::shared_ptr<shared_state> state
)
{
    error_code ec;

    // A buffer to read incoming client requests
    beast::flat_buffer buff;

    // A stream allows us to set quality-of-service parameters for the connection,
    // like timeouts.
    beast::tcp_stream stream(std::move(socket));

    while (true)
    {
        // Construct a new parser for each message
        http::request_parser<http::string_body> parser;

        // Apply a reasonable limit to the allowed size
        // of the body in bytes to prevent abuse.
        parser.body_limit(max_body_size);

        // Set the timeout.
        stream.expires_after(std::chrono::seconds(30));

        // Read a request
        co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));

        if (ec == http::error::end_of_stream)
        {
            // This means they closed the connection
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
        else if (ec)
        {
            // An unknown error happened
            co_return log_error(ec, "read");
        }

        // Attempt to serve the request and generate a response
        http::message_generator msg = co_await handle_http_request(parser.release(), *state);

        // Determine if we should close the connection
        bool keep_alive = msg.keep_alive();

        // Send the response. Handlers may take long, so reset the timeout
        stream.expires_after(std::chrono::seconds(30));
        co_await beast::async_write(stream, std::move(msg), asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "write");
            co_return;
        }

        // This means we should close the connection, usually because
        // the response indicated the "Connection: close" semantic.
        if (!keep_alive)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/http_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/version.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url_view.hpp>

#include <chrono>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string>
#include <string_view>
#include <utility>

#include "error.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

// Applies to the overall exchange (connect, handshake, write and read)
static constexpr std::chrono::seconds io_timeout{30};

// Upstream responses larger than this are rejected
static constexpr std::size_t max_response_size = 16u * 1024u * 1024u;

namespace {

// Where the upstream API lives, as parsed from the base URL
struct upstream_location
{
    bool use_tls{};

    // Host name or IP address to connect to, without brackets
    std::string host;

    // Port, as a string, as required by the resolver
    std::string port;

    // Value for the Host header
    std::string host_header;

    // Prepended to all request targets. Has no trailing slash
    std::string path_prefix;
};

result_with_message<upstream_location> parse_base_url(std::string_view base_url)
{
    auto url_result = boost::urls::parse_absolute_uri(base_url);
    if (url_result.has_error())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::invalid_base_url, std::string(base_url))
    boost::urls::url_view url = *url_result;

    upstream_location res;

    // Only plain HTTP and HTTPS are supported
    if (url.scheme_id() == boost::urls::scheme::https)
        res.use_tls = true;
    else if (url.scheme_id() != boost::urls::scheme::http)
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::invalid_base_url, "Unsupported scheme: " + std::string(base_url))

    // We need a host, and the URL can't contain anything other than a path
    if (url.host_address().empty())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::invalid_base_url, "Missing host: " + std::string(base_url))
    if (url.has_query() || url.has_fragment() || url.has_userinfo())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(
            errc::invalid_base_url,
            "Base URL may only contain a path: " + std::string(base_url)
        )

    res.host = url.host_address();
    res.port = url.has_port() ? std::string(std::string_view(url.port())) : (res.use_tls ? "443" : "80");
    res.host_header = std::string_view(url.encoded_host_and_port());
    res.path_prefix = std::string_view(url.encoded_path());
    while (!res.path_prefix.empty() && res.path_prefix.back() == '/')
        res.path_prefix.pop_back();
    return res;
}

// Writes a request and reads the response over an already connected stream
template <class Stream>
asio::awaitable<result_with_message<http_response>> exchange(
    Stream& stream,
    const http::request<http::string_body>& req
)
{
    error_code ec;

    co_await http::async_write(stream, req, asio::redirect_error(ec));
    if (ec)
        co_return error_with_message{ec, "Writing upstream request"};

    beast::flat_buffer buff;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_response_size);
    co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));
    if (ec)
        co_return error_with_message{ec, "Reading upstream response"};

    auto res = parser.release();
    co_return http_response{res.result_int(), std::move(res.body())};
}

class beast_http_client final : public http_client
{
    asio::any_io_executor ex_;
    upstream_location loc_;
    asio::ssl::context ssl_ctx_{asio::ssl::context::tls_client};

    http::request<http::string_body> build_request(http_request&& input) const
    {
        http::request<http::string_body> res{input.method, loc_.path_prefix + input.target, 11};
        res.set(http::field::host, loc_.host_header);
        res.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::accept, "application/json");
        for (const auto& header : input.headers)
            res.set(header.first, header.second);
        if (!input.content_type.empty())
        {
            res.set(http::field::content_type, input.content_type);
            res.body() = std::move(input.body);
        }
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    asio::awaitable<result_with_message<http_response>> send_plain(
        const http::request<http::string_body>& req,
        const asio::ip::tcp::resolver::results_type& endpoints
    )
    {
        error_code ec;

        beast::tcp_stream stream(ex_);
        stream.expires_after(io_timeout);
        co_await stream.async_connect(endpoints, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, "Connecting to " + loc_.host_header};

        auto res = co_await exchange(stream, req);

        // We already have what we need. Closing errors are not relevant
        stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        co_return res;
    }

    asio::awaitable<result_with_message<http_response>> send_tls(
        const http::request<http::string_body>& req,
        const asio::ip::tcp::resolver::results_type& endpoints
    )
    {
        error_code ec;

        beast::ssl_stream<beast::tcp_stream> stream(ex_, ssl_ctx_);

        // Set SNI. Many hosts need this to handshake successfully
        if (!SSL_set_tlsext_host_name(stream.native_handle(), loc_.host.c_str()))
        {
            co_return error_with_message{
                error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
                "Setting SNI hostname"
            };
        }

        // Verify that the certificate matches the host we're connecting to
        stream.set_verify_callback(asio::ssl::host_name_verification(loc_.host));

        beast::get_lowest_layer(stream).expires_after(io_timeout);
        co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, "Connecting to " + loc_.host_header};

        co_await stream.async_handshake(asio::ssl::stream_base::client, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, "TLS handshake with " + loc_.host_header};

        auto res = co_await exchange(stream, req);

        // Many servers close the connection without a proper TLS shutdown,
        // and we already have what we need. Closing errors are not relevant
        co_await stream.async_shutdown(asio::redirect_error(ec));
        co_return res;
    }

public:
    beast_http_client(asio::any_io_executor ex, upstream_location loc) : ex_(std::move(ex)), loc_(std::move(loc))
    {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
    }

    asio::awaitable<result_with_message<http_response>> send(http_request input) final override
    {
        error_code ec;

        // Compose the request
        auto req = build_request(std::move(input));

        // Resolve the upstream host. This is done per request, as DNS records may change
        asio::ip::tcp::resolver resolver(ex_);
        auto endpoints = co_await resolver.async_resolve(loc_.host, loc_.port, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, "Resolving " + loc_.host};

        if (loc_.use_tls)
            co_return co_await send_tls(req, endpoints);
        else
            co_return co_await send_plain(req, endpoints);
    }
};

}  // namespace

result_with_message<std::unique_ptr<http_client>> rcfacade::create_http_client(
    asio::any_io_executor ex,
    std::string_view base_url
)
{
    auto loc_result = parse_base_url(base_url);
    if (loc_result.has_error())
        return std::move(loc_result).error();
    std::unique_ptr<http_client> res = std::make_unique<beast_http_client>(
        std::move(ex),
        std::move(*loc_result)
    );
    return res;
}

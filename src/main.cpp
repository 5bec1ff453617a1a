//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "services/http_client.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace rcfacade;

static int main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 3)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 8080\n"
                  << "Upstream settings are read from the ROCKETCHAT_API_* environment variables\n";
        return EXIT_FAILURE;
    }

    // Application config
    const char* ip = argv[1];                                     // IP where the server will listen
    auto port = static_cast<unsigned short>(std::atoi(argv[2]));  // Port

    // Upstream config
    auto config = load_upstream_config();
    if (config.has_error())
    {
        log_error(config.error(), "Loading configuration");
        return EXIT_FAILURE;
    }

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // The client used to talk to the upstream API. Validates the base URL
    auto http = create_http_client(ctx.get_executor(), config->base_url);
    if (http.has_error())
    {
        log_error(http.error(), "Creating the upstream HTTP client");
        return EXIT_FAILURE;
    }

    // Singleton objects shared by all connections
    auto st = std::make_shared<shared_state>(std::move(*config), std::move(*http));

    // The physical endpoint where our server will listen
    auto acceptor = create_listening_acceptor(
        ctx.get_executor(),
        asio::ip::tcp::endpoint(asio::ip::make_address(ip), port)
    );
    if (acceptor.has_error())
    {
        log_error(acceptor.error(), "Setting up the listening socket");
        return EXIT_FAILURE;
    }

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(std::move(*acceptor), st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([&ctx](boost::system::error_code, int) {
        // Stop the io_context. This will cause run() to return
        ctx.stop();
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}

#include "amilink.h"

#ifdef ASIO_STANDALONE
#include <asio/io_context.hpp>
#include <asio/co_spawn.hpp>
#include <asio/signal_set.hpp>
#else
#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#endif

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#ifndef ASIO_STANDALONE
namespace asio = boost::asio;
#endif

// Prints every event; hangups get their cause as well.
void watch(Ami::Session& session) {
    session.on("event", [](const Ami::Event& event) {
        std::cout << "==> " << event.name().value_or("?");
        if (auto channel = event.get("Channel")) {
            std::cout << " [" << *channel << "]";
        }
        std::cout << std::endl;
    });

    session.on("Hangup", [](const Ami::Event& event) {
        std::cout << "    cause: " << event.get("Cause-txt").value_or("unknown") << std::endl;
    });

    session.on("close", [](const Ami::Event& event) {
        std::cout << "Connection closed (error: " << event.get("HadError").value_or("false") << ")" << std::endl;
    });
}

asio::awaitable<void> run_events(asio::io_context& ioc, std::shared_ptr<Ami::Session>& out) {
    const char* host = std::getenv("AMI_HOST");
    const char* user = std::getenv("AMI_USER");
    const char* secret = std::getenv("AMI_SECRET");

    auto session = co_await Ami::Session::connect(ioc, {host ? host : "127.0.0.1", "5038"});
    out = session;
    watch(*session);

    co_await session->login({user ? user : "admin", secret ? secret : "amp111"});
    co_await session->request(Ami::Actions::events("call"));
    std::cout << "Listening for call events, Ctrl+C to stop" << std::endl;
}

int main() {
    Ami::logger.error = Ami::PRINT_LOG;
    try {
        asio::io_context ioc;
        std::shared_ptr<Ami::Session> session;

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto) {
            std::cout << "\nShutting down..." << std::endl;
            if (session) {
                session->end();
            } else {
                ioc.stop();
            }
        });

        asio::co_spawn(ioc, run_events(ioc, session), [&](std::exception_ptr e) {
            if (e) {
                try { std::rethrow_exception(e); }
                catch (const std::exception& ex) {
                    std::cerr << "Coroutine exception: " << ex.what() << std::endl;
                }
                ioc.stop();
            }
        });

        ioc.run();

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

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
#include <string>

#ifndef ASIO_STANDALONE
namespace asio = boost::asio;
#endif

namespace {

std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

/**
 * Logs in, pings the server, runs one CLI command and logs off cleanly.
 */
asio::awaitable<void> run_ping(asio::io_context& ioc) {
    const Ami::ServerAddress address{env_or("AMI_HOST", "127.0.0.1"), env_or("AMI_PORT", "5038")};
    const Ami::Credentials credentials{env_or("AMI_USER", "admin"), env_or("AMI_SECRET", "amp111")};

    auto session = co_await Ami::Session::connect(ioc, address);

    try {
        auto login = co_await session->login(credentials, Ami::LoginMode::Md5Challenge, false);
        std::cout << "-> Logged in: " << login.message().value_or("") << std::endl;

        auto pong = co_await session->request(Ami::Actions::ping());
        std::cout << "-> Ping: " << pong.get("Ping").value_or("?")
                  << " (banner: " << session->banner().value_or("none") << ")" << std::endl;

        auto uptime = co_await session->request(Ami::Actions::command("core show uptime"));
        std::cout << "-> core show uptime:\n" << uptime.get("Output").value_or("") << std::endl;

        co_await session->request(Ami::Actions::logoff());
    } catch (const Ami::ActionError& e) {
        std::cerr << "-> Action failed (" << Ami::to_string(e.kind()) << "): " << e.what() << std::endl;
    }

    session->end();
}

int main() {
    Ami::logger.info = Ami::PRINT_LOG;
    Ami::logger.error = Ami::PRINT_LOG;
    try {
        asio::io_context ioc;
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto) {
            std::cout << "\nShutting down..." << std::endl;
            ioc.stop();
        });

        asio::co_spawn(ioc, run_ping(ioc), [&](std::exception_ptr e) {
            if (e) {
                try { std::rethrow_exception(e); }
                catch (const std::exception& ex) {
                    std::cerr << "Coroutine exception: " << ex.what() << std::endl;
                }
            }
            signals.cancel();
        });

        ioc.run();

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

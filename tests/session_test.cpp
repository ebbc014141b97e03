#include "test_helpers.h"
#ifdef ASIO_STANDALONE
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#else
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#endif

#include <array>
#include <chrono>
#include <functional>

using namespace TestHelpers;
using namespace std::chrono_literals;

namespace {

using tcp = asio::ip::tcp;

// Replies that make the fake server hang up instead of answering.
const std::string DROP_CONNECTION = "<drop>";
const std::string RESET_CONNECTION = "<reset>";

/**
 * Single-connection manager endpoint on a loopback port.
 * Sends the greeting, then answers each decoded action with responder().
 */
class FakeAmiServer {
public:
    using Responder = std::function<std::string(const Ami::FieldSet&)>;

    FakeAmiServer(asio::io_context& ioc, Responder responder)
        : acceptor_(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          responder_(std::move(responder)) {
        asio::co_spawn(acceptor_.get_executor(), serve(), asio::detached);
    }

    Ami::ServerAddress address() const {
        return {"127.0.0.1", std::to_string(acceptor_.local_endpoint().port())};
    }

    std::vector<Ami::FieldSet> received;
    bool peer_disconnected = false;

private:
    asio::awaitable<void> serve() {
        auto socket = co_await acceptor_.async_accept(asio::use_awaitable);

        const std::string greeting = "Asterisk Call Manager/5.0.1\r\n";
        co_await asio::async_write(socket, asio::buffer(greeting), asio::use_awaitable);

        Ami::Parser::FrameDecoder decoder;
        std::array<char, 4096> buffer;
        for (;;) {
            asio_system::error_code ec;
            std::size_t n = co_await socket.async_read_some(
                asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                peer_disconnected = true;
                co_return;
            }

            decoder.feed(std::string_view(buffer.data(), n));
            while (auto block = decoder.next()) {
                received.emplace_back(std::move(*block));
                std::string reply = responder_(received.back());
                if (reply == DROP_CONNECTION) {
                    socket.close();
                    co_return;
                }
                if (reply == RESET_CONNECTION) {
                    socket.set_option(asio::socket_base::linger(true, 0));
                    socket.close();
                    co_return;
                }
                if (!reply.empty()) {
                    co_await asio::async_write(socket, asio::buffer(reply), asio::use_awaitable);
                }
            }
        }
    }

    tcp::acceptor acceptor_;
    Responder responder_;
};

std::string id_of(const Ami::FieldSet& action) {
    return std::string(action.action_id().value_or(""));
}

std::string pong(const Ami::FieldSet& action) {
    return response_text(id_of(action), "Success", "Ping: Pong\r\n");
}

// Runs the client coroutine and reports any exception it let escape.
std::string run_client(asio::io_context& ioc, std::function<asio::awaitable<void>()> body) {
    std::string failure;
    asio::co_spawn(ioc, std::move(body), [&failure](std::exception_ptr error) {
        if (!error) return;
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            failure = e.what();
        }
    });
    run_io_context_for(ioc, 5000ms);
    return failure;
}

} // namespace

TEST_CASE("Session: request - Ping over loopback -> Pong response and banner") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, pong);
    std::shared_ptr<Ami::Session> session;
    std::string reply;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        auto response = co_await session->request(Ami::Actions::ping());
        reply = std::string(response.get("Ping").value_or(""));
        session->end();
    });

    REQUIRE(failure.empty());
    REQUIRE(reply == "Pong");
    REQUIRE(session->banner() == "Asterisk Call Manager/5.0.1");
    REQUIRE(session->get_state() == Ami::ClientState::CLOSED);
    REQUIRE(server.received.size() == 1);
    REQUIRE(server.received[0].get("Action") == "Ping");
    REQUIRE_FALSE(id_of(server.received[0]).empty());
    REQUIRE(server.peer_disconnected);
}

TEST_CASE("Session: Events interleaved with a response -> Delivered before the completion") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, [](const Ami::FieldSet& action) {
        return event_text("PeerStatus", "Peer: PJSIP/100\r\nPeerStatus: Reachable\r\n") + pong(action);
    });
    std::shared_ptr<Ami::Session> session;
    std::vector<std::string> order;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        session->on("peerstatus", [&](const Ami::Event& event) {
            order.push_back("event:" + std::string(event.get("Peer").value_or("")));
        });
        co_await session->request(Ami::Actions::ping());
        order.push_back("response");
        session->close();
    });

    REQUIRE(failure.empty());
    REQUIRE(order == std::vector<std::string>{"event:PJSIP/100", "response"});
}

TEST_CASE("Session: login - MD5 challenge -> Key derived from the challenge") {
    const std::string challenge = "840415273";
    asio::io_context ioc;
    FakeAmiServer server(ioc, [&](const Ami::FieldSet& action) {
        if (action.get("Action") == "Challenge") {
            return response_text(id_of(action), "Success", "Challenge: " + challenge + "\r\n");
        }
        if (action.get("Key") == Ami::Crypto::md5_login_key(challenge, "mysecret")) {
            return response_text(id_of(action), "Success", "Message: Authentication accepted\r\n");
        }
        return response_text(id_of(action), "Error", "Message: Authentication failed\r\n");
    });
    std::shared_ptr<Ami::Session> session;
    std::string message;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        auto response = co_await session->login({"admin", "mysecret"}, Ami::LoginMode::Md5Challenge);
        message = std::string(response.message().value_or(""));
        session->end();
    });

    REQUIRE(failure.empty());
    REQUIRE(message == "Authentication accepted");
    REQUIRE(server.received.size() == 2);
    REQUIRE(server.received[0].get("AuthType") == "MD5");
    REQUIRE(server.received[1].get("Username") == "admin");
    REQUIRE_FALSE(server.received[1].contains("Secret"));
}

TEST_CASE("Session: login - Plain secret refused -> ActionError with the response") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, [](const Ami::FieldSet& action) {
        return response_text(id_of(action), "Error", "Message: Authentication failed\r\n");
    });
    std::shared_ptr<Ami::Session> session;
    std::optional<Ami::ErrorKind> kind;
    std::string message;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        try {
            co_await session->login({"admin", "wrong"});
        } catch (const Ami::ActionError& e) {
            kind = e.kind();
            message = e.response() ? std::string(e.response()->message().value_or("")) : "";
        }
        session->close();
    });

    REQUIRE(failure.empty());
    REQUIRE(kind == Ami::ErrorKind::ProtocolError);
    REQUIRE(message == "Authentication failed");
    REQUIRE(server.received[0].get("Secret") == "wrong");
}

TEST_CASE("Session: Server hangs up with a request pending -> ConnectionClosed") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, [](const Ami::FieldSet&) { return DROP_CONNECTION; });
    std::shared_ptr<Ami::Session> session;
    std::optional<Ami::ErrorKind> kind;
    bool close_seen = false;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        session->on("close", [&](const Ami::Event&) { close_seen = true; });
        try {
            co_await session->request(Ami::Actions::ping());
        } catch (const Ami::ActionError& e) {
            kind = e.kind();
        }
    });

    REQUIRE(failure.empty());
    REQUIRE(kind == Ami::ErrorKind::ConnectionClosed);
    REQUIRE(close_seen);
    REQUIRE(session->get_state() == Ami::ClientState::CLOSED);
}

TEST_CASE("Session: connect - Nothing listening -> Throws system_error") {
    asio::io_context ioc;
    Ami::ServerAddress address;
    {
        tcp::acceptor probe(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        address = {"127.0.0.1", std::to_string(probe.local_endpoint().port())};
    }

    bool refused = false;
    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        try {
            co_await Ami::Session::connect(ioc, address);
        } catch (const asio_system::system_error&) {
            refused = true;
        }
    });

    REQUIRE(failure.empty());
    REQUIRE(refused);
}

TEST_CASE("Session: on_close / on_error - Orderly hang-up -> Close without error") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, [](const Ami::FieldSet&) { return DROP_CONNECTION; });
    std::shared_ptr<Ami::Session> session;
    std::vector<std::string> notifications;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        session->on_error([&](std::string_view message) {
            notifications.push_back("error:" + std::string(message));
        });
        session->on_close([&](bool had_error) {
            notifications.push_back(had_error ? "close:error" : "close:clean");
        });
        session->async_queue(Ami::Actions::ping(), nullptr);
        co_return;
    });

    REQUIRE(failure.empty());
    REQUIRE(notifications == std::vector<std::string>{"close:clean"});
}

TEST_CASE("Session: on_close / on_error - Connection reset -> Error then close with error") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, [](const Ami::FieldSet&) { return RESET_CONNECTION; });
    std::shared_ptr<Ami::Session> session;
    std::vector<std::string> notifications;
    std::optional<Ami::ErrorKind> kind;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        session->on_error([&](std::string_view message) {
            notifications.push_back(message.empty() ? "error:" : "error:reset");
        });
        session->on_close([&](bool had_error) {
            notifications.push_back(had_error ? "close:error" : "close:clean");
        });
        try {
            co_await session->request(Ami::Actions::ping());
        } catch (const Ami::ActionError& e) {
            kind = e.kind();
        }
    });

    REQUIRE(failure.empty());
    REQUIRE(kind == Ami::ErrorKind::ConnectionClosed);
    REQUIRE(notifications == std::vector<std::string>{"error:reset", "close:error"});
    REQUIRE(session->get_state() == Ami::ClientState::CLOSED);
}

TEST_CASE("Session: on_close / on_error - Empty handler -> Throws invalid_argument") {
    asio::io_context ioc;
    FakeAmiServer server(ioc, pong);
    std::shared_ptr<Ami::Session> session;
    int rejected = 0;

    auto failure = run_client(ioc, [&]() -> asio::awaitable<void> {
        session = co_await Ami::Session::connect(ioc, server.address());
        try { session->on_close(nullptr); } catch (const std::invalid_argument&) { rejected++; }
        try { session->on_error(nullptr); } catch (const std::invalid_argument&) { rejected++; }
        session->close();
    });

    REQUIRE(failure.empty());
    REQUIRE(rejected == 2);
}

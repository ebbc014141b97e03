/*
 * amilink.h - A simple C++23 Asio Asterisk Manager Interface Client
 *
 * Header file for the amilink library.
 *
 * Dependencies:
 * - Asio
 * - OpenSSL
 *
 * License: Boost Software License v1
 */

#pragma once

#include <utility>

#ifdef ASIO_STANDALONE
#include <asio/io_context.hpp>
#include <asio/strand.hpp>
#include <asio/awaitable.hpp>
#include <asio/any_io_executor.hpp>
#else
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/any_io_executor.hpp>
#endif

#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include <optional>
#include <string_view>
#include <stdexcept>
#include <exception>
#include <initializer_list>
#include <utility>
#include <variant>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <compare>

namespace Ami {
    #ifndef ASIO_STANDALONE
    namespace asio = boost::asio;
    #endif

    /**
     * @brief Represents an AMI server address.
     */
    struct ServerAddress {
        std::string host;
        std::string port = "5038";

        auto operator<=>(const ServerAddress&) const = default;
    };

    /**
     * @brief Manager account used by an explicitly requested login.
     */
    struct Credentials {
        std::string username;
        std::string secret;
    };

    enum class LoginMode {
        Plain,
        Md5Challenge
    };

    /**
     * @brief Connection lifecycle state. CLOSED is terminal.
     */
    enum class ClientState {
        OPEN,
        ENDING,
        CLOSED
    };

    enum class ErrorKind {
        TransportFault,
        ConnectionClosed,
        ConnectionEnding,
        ProtocolError,
        DuplicateActionId
    };

    std::string_view to_string(ErrorKind kind);

    /**
     * @struct Logger
     * @brief Injectable logging interface for the Ami namespace.
     */
    struct Logger {
        using LogFunc = std::function<void(std::string_view)>;

        LogFunc info = [](std::string_view) { /* no-op */ };
        LogFunc error = [](std::string_view) { /* no-op */ };
    };

    /**
     * @brief Global logger instance for the Ami namespace.
     */
    inline Logger logger;

    /**
     * @brief Utility function for debug logging to stderr.
     */
    inline void PRINT_LOG(std::string_view msg) {
        std::cerr << msg << std::endl;
    }

    /**
     * @brief ASCII case-insensitive comparison used for every field name lookup.
     */
    bool iequals(std::string_view a, std::string_view b);

    using Field = std::pair<std::string, std::string>;

    /**
     * @class FieldSet
     * @brief Ordered list of (name, value) pairs with case-insensitive lookup.
     *
     * Names may repeat. Insertion order is kept for iteration and
     * serialization, and every pair keeps the casing it was given.
     */
    class FieldSet {
    public:
        FieldSet() = default;
        explicit FieldSet(std::vector<Field> fields) : fields_(std::move(fields)) {}
        FieldSet(std::initializer_list<Field> fields) : fields_(fields) {}

        /**
         * @brief First value whose name matches, ignoring case.
         * The view is only valid as long as this object exists.
         */
        std::optional<std::string_view> get(std::string_view name) const;

        /**
         * @brief Every matching value in wire order (empty if none).
         */
        std::vector<std::string_view> get_all(std::string_view name) const;

        /**
         * @brief Name of the first matching field, in the casing it was received.
         */
        std::optional<std::string_view> name_of(std::string_view name) const;

        bool contains(std::string_view name) const { return get(name).has_value(); }

        const std::vector<Field>& fields() const { return fields_; }
        std::size_t size() const { return fields_.size(); }
        bool empty() const { return fields_.empty(); }

        std::optional<std::string_view> action_id() const { return get("ActionID"); }

        bool operator==(const FieldSet&) const = default;

    protected:
        std::vector<Field> fields_;
    };

    /**
     * @class Action
     * @brief An outgoing command. Always starts with its "Action" field.
     */
    class Action : public FieldSet {
    public:
        /**
         * @throws std::invalid_argument if the name is empty or a field cannot be framed.
         */
        explicit Action(std::string name, std::vector<Field> fields = {});

        /**
         * @brief Appends a field. Repeated names are allowed (e.g. Variable).
         * @throws std::invalid_argument on an empty name, a ':' in the name or CR/LF anywhere.
         */
        Action& add(std::string name, std::string value);

        /**
         * @brief Replaces the first ActionID value or appends one.
         */
        Action& set_action_id(std::string id);

        std::string_view name() const { return fields_.front().second; }

        /**
         * @brief Wire form: one "Name: Value\r\n" per field followed by a blank line.
         */
        std::string serialize() const;
    };

    /**
     * @class Response
     * @brief An incoming message tagged with a "Response" field.
     */
    class Response : public FieldSet {
    public:
        using FieldSet::FieldSet;

        std::optional<std::string_view> status() const { return get("Response"); }
        std::optional<std::string_view> message() const { return get("Message"); }

        // "Response: Error" is the protocol's failure indicator.
        bool is_error() const;
    };

    /**
     * @class Event
     * @brief An incoming, uncorrelated notification tagged with an "Event" field.
     */
    class Event : public FieldSet {
    public:
        using FieldSet::FieldSet;

        std::optional<std::string_view> name() const { return get("Event"); }
    };

    /**
     * @class ActionError
     * @brief Failure delivered to the caller of a queued action.
     *
     * For ErrorKind::ProtocolError the server answered with "Response: Error"
     * and response() holds that answer in full.
     */
    class ActionError : public std::runtime_error {
    public:
        ActionError(ErrorKind kind, const std::string& what, std::optional<Response> response = std::nullopt);

        ErrorKind kind() const noexcept { return kind_; }
        const std::optional<Response>& response() const noexcept { return response_; }

    private:
        ErrorKind kind_;
        std::optional<Response> response_;
    };

    class Client;

    /**
     * @class ActionResult
     * @brief Single-resolution handle for a queued action.
     *
     * Completes exactly once, with either the matching Response or an
     * ActionError. Copies share the same state.
     */
    class ActionResult {
    public:
        /**
         * @brief Completion handler. On success the exception_ptr is null.
         * Same signature as the one used by the awaitable request wrapper.
         */
        using Completion = std::function<void(std::exception_ptr, Response)>;

        ActionResult();

        bool ready() const;
        bool succeeded() const;

        /**
         * @brief Returns the Response or rethrows the ActionError.
         * @throws std::logic_error if the result is not ready yet.
         */
        Response get() const;

        /**
         * @brief Registers the completion. Runs immediately if already complete.
         * Only one completion may be registered.
         */
        void on_complete(Completion handler);

        const std::string& action_id() const;

    private:
        friend class Client;

        bool resolve(Response response);
        bool fail(std::exception_ptr error);
        void set_action_id(std::string id);

        struct State;
        std::shared_ptr<State> state_;
    };

    namespace Parser {
        using RawBlock = std::vector<Field>;
        using Incoming = std::variant<Response, Event>;

        /**
         * @class FrameDecoder
         * @brief Turns an unbounded byte stream into complete raw message blocks.
         *
         * feed() only buffers; next() parses lazily and yields one block per
         * blank-line terminator. Chunks may split lines and blocks anywhere.
         * Once finish() has been called and the buffered blocks are drained the
         * decoder is exhausted for good: a new connection needs a new decoder.
         */
        class FrameDecoder {
        public:
            static constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 64 * 1024;

            explicit FrameDecoder(std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH);

            /**
             * @throws std::logic_error if called after finish().
             */
            void feed(std::string_view chunk);

            /**
             * @brief Marks the end of the stream. Incomplete input is discarded.
             */
            void finish();

            std::optional<RawBlock> next();

            bool finished() const { return finished_; }
            bool exhausted() const;

            /**
             * @brief Greeting line sent by the server before the first block, if any.
             */
            const std::optional<std::string>& banner() const { return banner_; }

            std::size_t buffered_bytes() const { return buffer_.size() - read_pos_; }

        private:
            void discard_long_line();
            std::optional<RawBlock> take_line(std::string_view line);
            void add_output_line(std::string_view line);
            RawBlock complete_block();

            std::size_t max_line_length_;
            std::string buffer_;
            std::size_t read_pos_ = 0;
            bool skipping_long_line_ = false;
            bool at_stream_start_ = true;
            bool finished_ = false;
            std::optional<std::string> banner_;

            RawBlock current_;
            // "Response: Follows" command output state for the current block
            bool follows_ = false;
            bool output_open_ = false;
            bool output_done_ = false;
            std::string output_;
        };

        /**
         * @brief Response if a "Response" field is present, else Event if an
         * "Event" field is present, else nothing (the caller drops it).
         */
        std::optional<Incoming> classify(RawBlock block);

        std::string serialize(const std::vector<Field>& fields);
    } // namespace Parser

    /**
     * @interface Transport
     * @brief Outgoing half of an already-open byte stream.
     *
     * Inbound bytes, EOF and faults are pushed into Client::on_data,
     * Client::on_transport_closed and Client::on_transport_error.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Hands bytes to the stream without blocking.
         * @throws std::exception if the bytes cannot be accepted.
         */
        virtual void write(std::string data) = 0;

        virtual void close() = 0;
    };

    struct ClientOptions {
        // Prefix for generated ActionIDs. Empty means a random per-client prefix.
        std::string action_id_prefix;
        std::size_t max_line_length = Parser::FrameDecoder::DEFAULT_MAX_LINE_LENGTH;
    };

    /**
     * @class Client
     * @brief Correlation and dispatch engine for one connection.
     *
     * Not thread-safe: every call, including the inbound ones, must come from
     * the same logical stream of control (Session uses a strand for this).
     *
     * Channels for on(): "event" gets every Event, "close" and "error" get
     * synthetic notifications, any other name gets the Events of that type.
     * The synthetic "close" Event carries "HadError: true|false", the "error"
     * one carries the fault text in "Message".
     */
    class Client {
    public:
        using EventHandler = std::function<void(const Event&)>;

        explicit Client(std::shared_ptr<Transport> transport, ClientOptions options = {});

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * @brief Writes the action and returns its pending result.
         *
         * An ActionID is generated when the action has none. Fails the returned
         * handle immediately when the client is ENDING or CLOSED, when the id is
         * already pending, or when the transport refuses the write.
         */
        ActionResult queue(Action action);

        void on(std::string_view name, EventHandler handler);

        /**
         * @brief Stops accepting actions, closes once nothing is pending.
         */
        void end();

        /**
         * @brief Fails everything pending and closes now.
         */
        void close();

        void on_data(std::string_view chunk);
        void on_transport_closed();
        void on_transport_error(std::string_view error);

        ClientState get_state() const { return state_; }
        std::size_t pending_count() const { return pending_.size(); }
        const std::optional<std::string>& banner() const { return decoder_.banner(); }

    private:
        struct PendingEntry {
            ActionResult result;
            std::uint64_t sequence;
        };

        std::string next_action_id();
        void dispatch(Response response);
        void dispatch(const Event& event);
        void emit(std::string_view channel, const Event& notification);
        void shutdown(bool had_error);

        std::shared_ptr<Transport> transport_;
        ClientState state_ = ClientState::OPEN;
        Parser::FrameDecoder decoder_;

        std::string id_prefix_;
        std::uint64_t id_counter_ = 0;
        std::uint64_t sequence_ = 0;
        std::unordered_map<std::string, PendingEntry> pending_;

        std::vector<std::pair<std::string, EventHandler>> handlers_;
    };

    /**
     * @brief One builder per well-known action. Nothing but field assembly.
     */
    namespace Actions {
        Action ping();
        Action login(std::string username, std::string secret, bool events = true);
        Action challenge();
        Action login_md5(std::string username, std::string key, bool events = true);
        Action logoff();
        Action command(std::string command);
        Action events(std::string event_mask);
        Action originate(std::string channel, std::string context, std::string exten,
                         std::string priority = "1", std::vector<Field> variables = {});
        Action hangup(std::string channel);
        Action status(std::string channel = {});
        Action get_var(std::string variable, std::string channel = {});
        Action set_var(std::string variable, std::string value, std::string channel = {});
    } // namespace Actions

    namespace Crypto {
        /**
         * @brief Key for an MD5 challenge login: lowercase hex of MD5(challenge + secret).
         */
        std::string md5_login_key(std::string_view challenge, std::string_view secret);
    } // namespace Crypto

    /**
     * @class Session
     * @brief A Client bound to a TCP or TLS socket driven by Asio.
     *
     * All engine work runs on the session strand, event handlers included.
     * Completions are posted to the io_context.
     */
    class Session {
        struct Impl;
        struct PrivateTag { explicit PrivateTag() = default; };

    public:
        Session(PrivateTag, std::shared_ptr<Impl> impl);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @brief Resolves, connects and (with use_ssl) performs the TLS handshake.
         * @throws system_error on resolution, connection or handshake failure.
         */
        static asio::awaitable<std::shared_ptr<Session>> connect(
            asio::io_context& ioc,
            ServerAddress address,
            bool use_ssl = false,
            ClientOptions options = {}
        );

        void async_queue(Action action, ActionResult::Completion handler);

        /**
         * @brief Coroutine wrapper for async_queue.
         * @throws ActionError when the action fails.
         */
        asio::awaitable<Response> request(Action action);

        /**
         * @brief Sends Login, preceded by Challenge for LoginMode::Md5Challenge.
         * @throws ActionError when the server refuses.
         */
        asio::awaitable<Response> login(Credentials credentials,
                                        LoginMode mode = LoginMode::Plain,
                                        bool events = true);

        void on(std::string name, Client::EventHandler handler);

        // Shorthands for on("close") and on("error").
        void on_close(std::function<void(bool had_error)> handler);
        void on_error(std::function<void(std::string_view message)> handler);

        void end();
        void close();

        asio::any_io_executor get_executor() const;
        ClientState get_state() const;
        std::optional<std::string> banner() const;

    private:
        std::shared_ptr<Impl> impl_;
    };
} // namespace Ami

#include "amilink.h"

#ifdef ASIO_STANDALONE
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/write.hpp>
#include <asio/connect.hpp>
#include <asio/buffer.hpp>
#include <asio/post.hpp>
#include <asio/dispatch.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/async_result.hpp>
#include <asio/associated_executor.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#else
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#endif

#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <deque>
#include <iomanip>
#include <mutex>
#include <random>
#include <ranges>
#include <sstream>

#ifdef ASIO_STANDALONE
#include <system_error>
namespace asio_system = std;
#else
namespace asio_system = boost::system;
#endif

namespace Ami::Crypto {

// --- OpenSSL Smart Pointers ---
struct EVP_MD_CTX_deleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_deleter>;

std::string md5_login_key(std::string_view challenge, std::string_view secret) {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
    }

    // The key is MD5 over the concatenation, fed in two parts.
    if (EVP_DigestUpdate(md_ctx.get(), challenge.data(), challenge.size()) != 1 ||
        EVP_DigestUpdate(md_ctx.get(), secret.data(), secret.size()) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
    }

    constexpr std::string_view HEX = "0123456789abcdef";
    std::string key;
    key.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        key.push_back(HEX[digest[i] >> 4]);
        key.push_back(HEX[digest[i] & 0x0F]);
    }
    return key;
}

} // namespace Ami::Crypto

namespace Ami {

using namespace std::literals;
using tcp = asio::ip::tcp;
using asio_awaitable = asio::awaitable<void, asio::any_io_executor>;
constexpr auto use_awaitable_exec = asio::use_awaitable_t<asio::any_io_executor>{};

// Runs a subscriber or completion callback so that its failure stays local.
template <typename F>
void invoke_isolated(std::string_view what, F&& f) {
    try {
        std::forward<F>(f)();
    } catch (const std::exception& e) {
        logger.error("AMI-CLIENT: " + std::string(what) + " threw: " + e.what());
    } catch (...) {
        logger.error("AMI-CLIENT: " + std::string(what) + " threw a non-standard exception");
    }
}

// Random per-client ActionID prefix
std::string generate_id_prefix() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<std::uint64_t> dist;
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setw(16) << std::setfill('0') << dist(gen);
    return ss.str();
}

bool is_reserved_channel(std::string_view name) {
    return iequals(name, "event") || iequals(name, "close") || iequals(name, "error");
}

void check_field(std::string_view name, std::string_view value) {
    if (name.empty()) {
        throw std::invalid_argument("AMI field name must not be empty");
    }
    if (name.find_first_of(":\r\n") != std::string_view::npos) {
        throw std::invalid_argument("AMI field name '" + std::string(name) + "' contains ':' or a line break");
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument("AMI field '" + std::string(name) + "' has a line break in its value");
    }
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransportFault:    return "transport fault";
        case ErrorKind::ConnectionClosed:  return "connection closed";
        case ErrorKind::ConnectionEnding:  return "connection ending";
        case ErrorKind::ProtocolError:     return "protocol error";
        case ErrorKind::DuplicateActionId: return "duplicate ActionID";
    }
    return "unknown";
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// --- Message model ---

std::optional<std::string_view> FieldSet::get(std::string_view name) const {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return iequals(f.first, name); });
    if (it == fields_.end()) return std::nullopt;
    return std::string_view(it->second);
}

std::vector<std::string_view> FieldSet::get_all(std::string_view name) const {
    std::vector<std::string_view> values;
    for (const auto& [key, value] : fields_) {
        if (iequals(key, name)) values.emplace_back(value);
    }
    return values;
}

std::optional<std::string_view> FieldSet::name_of(std::string_view name) const {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return iequals(f.first, name); });
    if (it == fields_.end()) return std::nullopt;
    return std::string_view(it->first);
}

Action::Action(std::string name, std::vector<Field> fields) {
    if (name.empty()) {
        throw std::invalid_argument("AMI action name must not be empty");
    }
    check_field("Action", name);

    fields_.reserve(fields.size() + 1);
    fields_.emplace_back("Action", std::move(name));
    for (auto& [key, value] : fields) {
        add(std::move(key), std::move(value));
    }
}

Action& Action::add(std::string name, std::string value) {
    check_field(name, value);
    fields_.emplace_back(std::move(name), std::move(value));
    return *this;
}

Action& Action::set_action_id(std::string id) {
    if (id.empty()) {
        throw std::invalid_argument("ActionID must not be empty");
    }
    check_field("ActionID", id);

    auto it = std::ranges::find_if(fields_, [](const Field& f) { return iequals(f.first, "ActionID"); });
    if (it != fields_.end()) {
        it->second = std::move(id);
    } else {
        fields_.emplace_back("ActionID", std::move(id));
    }
    return *this;
}

std::string Action::serialize() const {
    return Parser::serialize(fields_);
}

bool Response::is_error() const {
    auto s = status();
    return s && iequals(*s, "Error");
}

ActionError::ActionError(ErrorKind kind, const std::string& what, std::optional<Response> response)
    : std::runtime_error(what), kind_(kind), response_(std::move(response)) {}

// --- ActionResult ---

struct ActionResult::State {
    std::mutex mutex;
    bool done = false;
    bool has_completion = false;
    std::optional<Response> response;
    std::exception_ptr error;
    Completion completion;
    std::string action_id;
};

ActionResult::ActionResult() : state_(std::make_shared<State>()) {}

bool ActionResult::ready() const {
    std::lock_guard lock(state_->mutex);
    return state_->done;
}

bool ActionResult::succeeded() const {
    std::lock_guard lock(state_->mutex);
    return state_->done && !state_->error;
}

Response ActionResult::get() const {
    std::lock_guard lock(state_->mutex);
    if (!state_->done) {
        throw std::logic_error("ActionResult is not ready");
    }
    if (state_->error) {
        std::rethrow_exception(state_->error);
    }
    return *state_->response;
}

void ActionResult::on_complete(Completion handler) {
    std::unique_lock lock(state_->mutex);
    if (state_->has_completion) {
        throw std::logic_error("ActionResult already has a completion handler");
    }
    state_->has_completion = true;

    if (!state_->done) {
        state_->completion = std::move(handler);
        return;
    }

    auto error = state_->error;
    auto response = state_->response.value_or(Response{});
    lock.unlock();
    invoke_isolated("Completion handler", [&] { handler(error, std::move(response)); });
}

const std::string& ActionResult::action_id() const {
    return state_->action_id;
}

void ActionResult::set_action_id(std::string id) {
    state_->action_id = std::move(id);
}

bool ActionResult::resolve(Response response) {
    Completion completion;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->done) return false;
        state_->done = true;
        state_->response = response;
        completion = std::move(state_->completion);
    }
    if (completion) {
        invoke_isolated("Completion handler", [&] { completion(nullptr, std::move(response)); });
    }
    return true;
}

bool ActionResult::fail(std::exception_ptr error) {
    Completion completion;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->done) return false;
        state_->done = true;
        state_->error = error;
        completion = std::move(state_->completion);
    }
    if (completion) {
        invoke_isolated("Completion handler", [&] { completion(error, Response{}); });
    }
    return true;
}

namespace Parser {

std::string serialize(const std::vector<Field>& fields) {
    std::string out;
    for (const auto& [name, value] : fields) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

FrameDecoder::FrameDecoder(std::size_t max_line_length)
    : max_line_length_(max_line_length) {}

void FrameDecoder::feed(std::string_view chunk) {
    if (finished_) {
        throw std::logic_error("FrameDecoder fed after the end of the stream");
    }
    buffer_.append(chunk);
}

void FrameDecoder::finish() {
    finished_ = true;
}

bool FrameDecoder::exhausted() const {
    return finished_ && buffered_bytes() == 0;
}

std::optional<RawBlock> FrameDecoder::next() {
    std::optional<RawBlock> block;

    while (!block) {
        const auto eol = buffer_.find('\n', read_pos_);
        if (eol == std::string::npos) break;

        std::string_view line(buffer_.data() + read_pos_, eol - read_pos_);
        read_pos_ = eol + 1;

        if (skipping_long_line_) {
            skipping_long_line_ = false;
            continue;
        }
        // Same measure as the unterminated tail below: raw bytes before '\n'.
        if (line.size() > max_line_length_) {
            discard_long_line();
            continue;
        }
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        block = take_line(line);
    }

    if (!block) {
        const std::size_t tail = buffer_.size() - read_pos_;
        if (skipping_long_line_) {
            read_pos_ = buffer_.size();
        } else if (tail > max_line_length_) {
            discard_long_line();
            skipping_long_line_ = true;
            read_pos_ = buffer_.size();
        }

        if (finished_ && (read_pos_ < buffer_.size() || !current_.empty() || output_open_)) {
            logger.info("AMI-CLIENT: Stream ended inside a message, discarding incomplete input");
            read_pos_ = buffer_.size();
            current_.clear();
            output_.clear();
            follows_ = output_open_ = output_done_ = false;
        }
    }

    buffer_.erase(0, read_pos_);
    read_pos_ = 0;
    return block;
}

void FrameDecoder::discard_long_line() {
    logger.error("AMI-CLIENT: Discarding line longer than " + std::to_string(max_line_length_) + " bytes");
    at_stream_start_ = false;
}

std::optional<RawBlock> FrameDecoder::take_line(std::string_view line) {
    const bool first_line = std::exchange(at_stream_start_, false);

    if (line.empty()) {
        if (current_.empty() && !output_open_) {
            return std::nullopt; // orphan blank line
        }
        return complete_block();
    }

    if (output_open_) {
        add_output_line(line);
        return std::nullopt;
    }

    const auto sep = line.find(':');
    if (sep == std::string_view::npos || sep == 0) {
        if (first_line) {
            banner_ = std::string(line);
            logger.info("AMI-CLIENT: Server greeting: " + *banner_);
        } else if (follows_ && !output_done_) {
            add_output_line(line);
        } else {
            logger.info("AMI-CLIENT: Skipping malformed line: [" + std::string(line) + "]");
        }
        return std::nullopt;
    }

    std::string name(line.substr(0, sep));
    std::string_view value = line.substr(sep + 1);
    if (value.starts_with(' ')) {
        value.remove_prefix(1); // the separator space written by serialize()
    }
    if (iequals(name, "Response") && iequals(value, "Follows")) {
        follows_ = true;
    }
    current_.emplace_back(std::move(name), std::string(value));
    return std::nullopt;
}

void FrameDecoder::add_output_line(std::string_view line) {
    constexpr std::string_view END_MARKER = "--END COMMAND--";

    const bool last = line.ends_with(END_MARKER);
    if (last) {
        line.remove_suffix(END_MARKER.size());
    }
    if (!line.empty()) {
        if (!output_.empty()) output_ += '\n';
        output_ += line;
    }

    if (last) {
        current_.emplace_back("Output", std::move(output_));
        output_.clear();
        output_open_ = false;
        output_done_ = true;
    } else {
        output_open_ = true;
    }
}

RawBlock FrameDecoder::complete_block() {
    if (output_open_) {
        current_.emplace_back("Output", std::move(output_));
    }
    RawBlock block = std::move(current_);
    current_.clear();
    output_.clear();
    follows_ = output_open_ = output_done_ = false;
    return block;
}

std::optional<Incoming> classify(RawBlock block) {
    auto has = [&block](std::string_view name) {
        return std::ranges::any_of(block, [name](const Field& f) { return iequals(f.first, name); });
    };

    if (has("Response")) {
        return Incoming{std::in_place_type<Response>, std::move(block)};
    }
    if (has("Event")) {
        return Incoming{std::in_place_type<Event>, std::move(block)};
    }

    logger.info("AMI-CLIENT: Dropping unclassifiable message with " + std::to_string(block.size()) +
                " field(s)" + (block.empty() ? "" : ", first: " + block.front().first));
    return std::nullopt;
}

} // namespace Parser

// --- Client ---

Client::Client(std::shared_ptr<Transport> transport, ClientOptions options)
    : transport_(std::move(transport)),
      decoder_(options.max_line_length),
      id_prefix_(options.action_id_prefix.empty() ? generate_id_prefix() : std::move(options.action_id_prefix))
{
    if (!transport_) {
        throw std::invalid_argument("AMI client needs a transport");
    }
}

std::string Client::next_action_id() {
    std::string id;
    do {
        id = id_prefix_ + "." + std::to_string(++id_counter_);
    } while (pending_.contains(id));
    return id;
}

ActionResult Client::queue(Action action) {
    ActionResult result;

    if (state_ == ClientState::ENDING) {
        result.fail(std::make_exception_ptr(ActionError(ErrorKind::ConnectionEnding, "Connection ending")));
        return result;
    }
    if (state_ == ClientState::CLOSED) {
        result.fail(std::make_exception_ptr(ActionError(ErrorKind::ConnectionClosed, "Connection closed")));
        return result;
    }

    auto existing = action.action_id();
    std::string id = (existing && !existing->empty()) ? std::string(*existing) : next_action_id();
    action.set_action_id(id);
    result.set_action_id(id);

    if (pending_.contains(id)) {
        logger.error("AMI-CLIENT: Refusing action " + std::string(action.name()) + ", ActionID " + id + " is already pending");
        result.fail(std::make_exception_ptr(ActionError(
            ErrorKind::DuplicateActionId, "ActionID '" + id + "' is already pending")));
        return result;
    }

    try {
        transport_->write(action.serialize());
    } catch (const std::exception& e) {
        logger.error("AMI-CLIENT: Write failed for action " + std::string(action.name()) + ": " + e.what());
        result.fail(std::make_exception_ptr(ActionError(
            ErrorKind::TransportFault, std::string("Write failed: ") + e.what())));
        on_transport_error(e.what());
        return result;
    }

    pending_.emplace(id, PendingEntry{result, ++sequence_});
    logger.info("AMI-CLIENT: Queued " + std::string(action.name()) + " (ActionID: " + id + ")");
    return result;
}

void Client::on(std::string_view name, EventHandler handler) {
    if (name.empty()) {
        throw std::invalid_argument("Subscription name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Subscription handler must not be empty");
    }
    handlers_.emplace_back(std::string(name), std::move(handler));
}

void Client::end() {
    if (state_ != ClientState::OPEN) return;

    state_ = ClientState::ENDING;
    logger.info("AMI-CLIENT: Ending with " + std::to_string(pending_.size()) + " action(s) pending");
    if (pending_.empty()) {
        shutdown(false);
    }
}

void Client::close() {
    if (state_ == ClientState::CLOSED) return;

    logger.info("AMI-CLIENT: Closing with " + std::to_string(pending_.size()) + " action(s) pending");
    shutdown(false);
}

void Client::on_data(std::string_view chunk) {
    if (state_ == ClientState::CLOSED) {
        logger.info("AMI-CLIENT: Ignoring " + std::to_string(chunk.size()) + " byte(s) received after close");
        return;
    }

    decoder_.feed(chunk);
    while (state_ != ClientState::CLOSED) {
        auto block = decoder_.next();
        if (!block) break;

        auto message = Parser::classify(std::move(*block));
        if (!message) continue;

        if (auto* response = std::get_if<Response>(&*message)) {
            dispatch(std::move(*response));
        } else {
            dispatch(std::get<Event>(*message));
        }
    }
}

void Client::on_transport_closed() {
    if (state_ == ClientState::CLOSED) return;

    logger.info("AMI-CLIENT: Transport closed.");
    shutdown(false);
}

void Client::on_transport_error(std::string_view error) {
    if (state_ == ClientState::CLOSED) return;

    logger.error("AMI-CLIENT: Transport fault: " + std::string(error));
    emit("error", Event{{"Event", "error"}, {"Message", std::string(error)}});
    if (state_ != ClientState::CLOSED) {
        shutdown(true);
    }
}

void Client::dispatch(Response response) {
    const auto id = response.action_id();
    if (!id) {
        logger.info("AMI-CLIENT: Dropping response without ActionID (Response: " +
                    std::string(response.status().value_or("")) + ")");
        return;
    }

    auto it = pending_.find(std::string(*id));
    if (it == pending_.end()) {
        logger.info("AMI-CLIENT: Dropping unmatched response for ActionID: " + std::string(*id));
        return;
    }

    auto entry = std::move(it->second);
    pending_.erase(it);

    if (response.is_error()) {
        std::string reason(response.message().value_or("Server returned an error response"));
        entry.result.fail(std::make_exception_ptr(ActionError(ErrorKind::ProtocolError, reason, std::move(response))));
    } else {
        entry.result.resolve(std::move(response));
    }

    if (state_ == ClientState::ENDING && pending_.empty()) {
        logger.info("AMI-CLIENT: All pending actions answered, closing.");
        shutdown(false);
    }
}

void Client::dispatch(const Event& event) {
    const std::string_view type = event.name().value_or("");
    const auto handlers = handlers_;

    for (const auto& [name, handler] : handlers) {
        if (state_ == ClientState::CLOSED) break;

        if (iequals(name, "event") || (!is_reserved_channel(name) && iequals(name, type))) {
            invoke_isolated("Event handler '" + name + "'", [&] { handler(event); });
        }
    }
}

void Client::emit(std::string_view channel, const Event& notification) {
    const auto handlers = handlers_;
    for (const auto& [name, handler] : handlers) {
        if (iequals(name, channel)) {
            invoke_isolated("'" + name + "' handler", [&] { handler(notification); });
        }
    }
}

void Client::shutdown(bool had_error) {
    state_ = ClientState::CLOSED;
    decoder_.finish();

    std::vector<PendingEntry> outstanding;
    outstanding.reserve(pending_.size());
    for (auto& [id, entry] : pending_) {
        outstanding.push_back(std::move(entry));
    }
    pending_.clear();
    std::ranges::sort(outstanding, {}, &PendingEntry::sequence);

    for (auto& entry : outstanding) {
        entry.result.fail(std::make_exception_ptr(ActionError(ErrorKind::ConnectionClosed, "Connection closed")));
    }

    if (auto transport = std::move(transport_)) {
        try {
            transport->close();
        } catch (const std::exception& e) {
            logger.error(std::string("AMI-CLIENT: Transport close failed: ") + e.what());
        }
    }

    logger.info("AMI-CLIENT: Closed.");
    emit("close", Event{{"Event", "close"}, {"HadError", had_error ? "true" : "false"}});
}

// --- Action builders ---

namespace Actions {

Action ping() {
    return Action("Ping");
}

Action login(std::string username, std::string secret, bool events) {
    return Action("Login", {
        {"Username", std::move(username)},
        {"Secret", std::move(secret)},
        {"Events", events ? "on" : "off"}
    });
}

Action challenge() {
    return Action("Challenge", {{"AuthType", "MD5"}});
}

Action login_md5(std::string username, std::string key, bool events) {
    return Action("Login", {
        {"AuthType", "MD5"},
        {"Username", std::move(username)},
        {"Key", std::move(key)},
        {"Events", events ? "on" : "off"}
    });
}

Action logoff() {
    return Action("Logoff");
}

Action command(std::string command) {
    return Action("Command", {{"Command", std::move(command)}});
}

Action events(std::string event_mask) {
    return Action("Events", {{"EventMask", std::move(event_mask)}});
}

Action originate(std::string channel, std::string context, std::string exten,
                 std::string priority, std::vector<Field> variables) {
    Action action("Originate", {
        {"Channel", std::move(channel)},
        {"Context", std::move(context)},
        {"Exten", std::move(exten)},
        {"Priority", std::move(priority)}
    });
    for (auto& [name, value] : variables) {
        action.add("Variable", name + "=" + value);
    }
    return action;
}

Action hangup(std::string channel) {
    return Action("Hangup", {{"Channel", std::move(channel)}});
}

Action status(std::string channel) {
    Action action("Status");
    if (!channel.empty()) action.add("Channel", std::move(channel));
    return action;
}

Action get_var(std::string variable, std::string channel) {
    Action action("Getvar");
    if (!channel.empty()) action.add("Channel", std::move(channel));
    action.add("Variable", std::move(variable));
    return action;
}

Action set_var(std::string variable, std::string value, std::string channel) {
    Action action("Setvar");
    if (!channel.empty()) action.add("Channel", std::move(channel));
    action.add("Variable", std::move(variable));
    action.add("Value", std::move(value));
    return action;
}

} // namespace Actions

// --- Asio transport ---

class UnifiedSocket {
    using plain_socket = tcp::socket;
    using ssl_socket = asio::ssl::stream<tcp::socket>;
    std::variant<plain_socket, ssl_socket> socket_;

public:
    UnifiedSocket(asio::io_context& ioc) : socket_(std::in_place_index<0>, ioc) {}
    UnifiedSocket(asio::io_context& ioc, asio::ssl::context& ctx) : socket_(std::in_place_index<1>, ioc, ctx) {}

    void close() {
        asio_system::error_code ec;
        if (auto* plain = std::get_if<plain_socket>(&socket_)) {
            plain->close(ec);
        } else if (auto* ssl = std::get_if<ssl_socket>(&socket_)) {
            ssl->lowest_layer().close(ec);
        }
    }

    template<typename EndpointRange>
    asio_awaitable connect_to_range(const EndpointRange& endpoints) {
        if (auto* plain = std::get_if<plain_socket>(&socket_)) {
            co_await asio::async_connect(*plain, endpoints, use_awaitable_exec);
        } else if (auto* ssl = std::get_if<ssl_socket>(&socket_)) {
            co_await asio::async_connect(ssl->lowest_layer(), endpoints, use_awaitable_exec);
        } else {
            throw std::runtime_error("Invalid socket state");
        }
        co_return;
    }

    asio_awaitable handshake() {
        if (auto* ssl = std::get_if<ssl_socket>(&socket_)) {
            co_await ssl->async_handshake(asio::ssl::stream_base::client, use_awaitable_exec);
        }
        co_return;
    }

    asio::awaitable<std::size_t, asio::any_io_executor> read_some(asio::mutable_buffer buf, asio_system::error_code& ec) {
        if (auto* plain = std::get_if<plain_socket>(&socket_)) {
            co_return co_await plain->async_read_some(buf, asio::redirect_error(use_awaitable_exec, ec));
        } else if (auto* ssl = std::get_if<ssl_socket>(&socket_)) {
            co_return co_await ssl->async_read_some(buf, asio::redirect_error(use_awaitable_exec, ec));
        } else {
            throw std::runtime_error("Invalid socket state");
        }
    }

    asio::awaitable<std::size_t, asio::any_io_executor> write(asio::const_buffer buf) {
        if (auto* plain = std::get_if<plain_socket>(&socket_)) {
            co_return co_await asio::async_write(*plain, buf, use_awaitable_exec);
        } else if (auto* ssl = std::get_if<ssl_socket>(&socket_)) {
            co_return co_await asio::async_write(*ssl, buf, use_awaitable_exec);
        } else {
            throw std::runtime_error("Invalid socket state");
        }
    }
};

/**
 * @class SocketTransport
 * @brief Transport over a UnifiedSocket. Every member runs on the session strand.
 */
class SocketTransport : public Transport,
                        public std::enable_shared_from_this<SocketTransport> {
public:
    using DataHandler = std::function<void(std::string_view)>;
    using ClosedHandler = std::function<void()>;
    using ErrorHandler = std::function<void(std::string_view)>;

    SocketTransport(
        asio::strand<asio::io_context::executor_type> strand,
        std::unique_ptr<UnifiedSocket> socket,
        std::shared_ptr<asio::ssl::context> ssl_ctx
    ) : strand_(std::move(strand)), ssl_ctx_(std::move(ssl_ctx)), socket_(std::move(socket)) {}

    void start(DataHandler on_data, ClosedHandler on_closed, ErrorHandler on_error) {
        on_data_ = std::move(on_data);
        on_closed_ = std::move(on_closed);
        on_error_ = std::move(on_error);
        asio::co_spawn(strand_, read_loop(shared_from_this()), asio::detached);
    }

    void write(std::string data) override {
        if (closed_) {
            throw std::runtime_error("Transport is closed");
        }
        outbox_.push_back(std::move(data));
        if (writing_) return;

        writing_ = true;
        asio::co_spawn(strand_, write_loop(shared_from_this()), asio::detached);
    }

    void close() override {
        if (std::exchange(closed_, true)) return;
        socket_->close();
    }

private:
    asio_awaitable read_loop([[maybe_unused]] std::shared_ptr<SocketTransport> self) {
        std::array<char, 8192> buf;

        while (!closed_) {
            asio_system::error_code ec;
            const std::size_t n = co_await socket_->read_some(asio::buffer(buf), ec);
            if (closed_) break;

            if (n > 0) {
                on_data_(std::string_view(buf.data(), n));
                if (closed_) break;
            }

            if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
                logger.info("AMI-CLIENT: Server closed the connection.");
                on_closed_();
                break;
            }
            if (ec) {
                on_error_(ec.message());
                break;
            }
        }
    }

    asio_awaitable write_loop([[maybe_unused]] std::shared_ptr<SocketTransport> self) {
        try {
            while (!outbox_.empty() && !closed_) {
                co_await socket_->write(asio::buffer(outbox_.front()));
                outbox_.pop_front();
            }
        } catch (const std::exception& e) {
            writing_ = false;
            if (!closed_) {
                on_error_(e.what());
            }
            co_return;
        }
        writing_ = false;
    }

    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<asio::ssl::context> ssl_ctx_;
    std::unique_ptr<UnifiedSocket> socket_;

    std::deque<std::string> outbox_;
    bool writing_ = false;
    bool closed_ = false;

    DataHandler on_data_;
    ClosedHandler on_closed_;
    ErrorHandler on_error_;
};

// --- Session ---

struct Session::Impl : public std::enable_shared_from_this<Session::Impl> {
    asio::io_context& ioc_;
    asio::strand<asio::io_context::executor_type> strand_;
    ClientOptions options_;
    std::shared_ptr<asio::ssl::context> ssl_ctx_;

    std::shared_ptr<SocketTransport> transport_;
    std::unique_ptr<Client> client_;

    std::atomic<ClientState> state_{ClientState::OPEN};
    mutable std::mutex banner_mutex_;
    std::optional<std::string> banner_;

    Impl(asio::io_context& ioc, ClientOptions options)
        : ioc_(ioc), strand_(ioc.get_executor()), options_(std::move(options)) {}

    ~Impl() {
        if (transport_) {
            asio::post(strand_, [t = transport_] { t->close(); });
        }
    }

    void start(std::unique_ptr<UnifiedSocket> socket) {
        transport_ = std::make_shared<SocketTransport>(strand_, std::move(socket), ssl_ctx_);
        client_ = std::make_unique<Client>(transport_, options_);

        std::weak_ptr<Impl> weak = shared_from_this();
        transport_->start(
            [weak](std::string_view chunk) {
                if (auto self = weak.lock()) {
                    self->client_->on_data(chunk);
                    self->sync();
                }
            },
            [weak] {
                if (auto self = weak.lock()) {
                    self->client_->on_transport_closed();
                    self->sync();
                }
            },
            [weak](std::string_view error) {
                if (auto self = weak.lock()) {
                    self->client_->on_transport_error(error);
                    self->sync();
                }
            }
        );
    }

    // Mirrors engine state for readers outside the strand.
    void sync() {
        state_.store(client_->get_state());
        if (client_->banner()) {
            std::lock_guard lock(banner_mutex_);
            if (!banner_) banner_ = client_->banner();
        }
    }

    void queue(Action action, ActionResult::Completion handler) {
        asio::post(strand_, [self = shared_from_this(), action = std::move(action), handler = std::move(handler)]() mutable {
            auto result = self->client_->queue(std::move(action));
            self->sync();
            if (!handler) return;

            result.on_complete([&ioc = self->ioc_, handler = std::move(handler)](std::exception_ptr error, Response response) {
                asio::post(ioc, [handler, error, response = std::move(response)]() mutable {
                    invoke_isolated("Completion handler", [&] { handler(error, std::move(response)); });
                });
            });
        });
    }
};

Session::Session(PrivateTag, std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}

Session::~Session() = default;

asio::awaitable<std::shared_ptr<Session>> Session::connect(
    asio::io_context& ioc,
    ServerAddress address,
    bool use_ssl,
    ClientOptions options
) {
    auto impl = std::make_shared<Impl>(ioc, std::move(options));

    logger.info("AMI-CLIENT: Connecting to " + address.host + ":" + address.port + (use_ssl ? " (TLS)" : "") + "...");

    tcp::resolver resolver(ioc);
    auto endpoints = co_await resolver.async_resolve(address.host, address.port, use_awaitable_exec);

    std::unique_ptr<UnifiedSocket> socket;
    if (use_ssl) {
        impl->ssl_ctx_ = std::make_shared<asio::ssl::context>(asio::ssl::context::tlsv12_client);
        impl->ssl_ctx_->set_default_verify_paths();
        impl->ssl_ctx_->set_verify_mode(asio::ssl::verify_peer);
        socket = std::make_unique<UnifiedSocket>(ioc, *impl->ssl_ctx_);
    } else {
        socket = std::make_unique<UnifiedSocket>(ioc);
    }

    co_await socket->connect_to_range(endpoints);
    co_await socket->handshake();

    logger.info("AMI-CLIENT: Connection established.");
    impl->start(std::move(socket));

    co_return std::make_shared<Session>(PrivateTag{}, std::move(impl));
}

void Session::async_queue(Action action, ActionResult::Completion handler) {
    impl_->queue(std::move(action), std::move(handler));
}

asio::awaitable<Response> Session::request(Action action) {
    co_return co_await asio::async_initiate<decltype(use_awaitable_exec), void(std::exception_ptr, Response)>(
        [impl = impl_](auto handler, Action action) {
            auto shared = std::make_shared<decltype(handler)>(std::move(handler));
            impl->queue(std::move(action), [shared](std::exception_ptr error, Response response) {
                auto ex = asio::get_associated_executor(*shared);
                asio::dispatch(ex, [shared, error, response = std::move(response)]() mutable {
                    (*shared)(error, std::move(response));
                });
            });
        },
        use_awaitable_exec,
        std::move(action)
    );
}

asio::awaitable<Response> Session::login(Credentials credentials, LoginMode mode, bool events) {
    if (mode == LoginMode::Plain) {
        co_return co_await request(Actions::login(credentials.username, credentials.secret, events));
    }

    const Response challenge = co_await request(Actions::challenge());
    const auto token = challenge.get("Challenge");
    if (!token || token->empty()) {
        throw ActionError(ErrorKind::ProtocolError, "Challenge response carried no Challenge field", challenge);
    }

    const std::string key = Crypto::md5_login_key(*token, credentials.secret);
    co_return co_await request(Actions::login_md5(credentials.username, key, events));
}

void Session::on(std::string name, Client::EventHandler handler) {
    if (name.empty()) {
        throw std::invalid_argument("Subscription name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Subscription handler must not be empty");
    }
    asio::post(impl_->strand_, [impl = impl_, name = std::move(name), handler = std::move(handler)]() mutable {
        impl->client_->on(name, std::move(handler));
    });
}

void Session::on_close(std::function<void(bool had_error)> handler) {
    if (!handler) {
        throw std::invalid_argument("Close handler must not be empty");
    }
    on("close", [handler = std::move(handler)](const Event& event) {
        handler(event.get("HadError") == "true");
    });
}

void Session::on_error(std::function<void(std::string_view message)> handler) {
    if (!handler) {
        throw std::invalid_argument("Error handler must not be empty");
    }
    on("error", [handler = std::move(handler)](const Event& event) {
        handler(event.get("Message").value_or(""));
    });
}

void Session::end() {
    asio::post(impl_->strand_, [impl = impl_] {
        impl->client_->end();
        impl->sync();
    });
}

void Session::close() {
    asio::post(impl_->strand_, [impl = impl_] {
        impl->client_->close();
        impl->sync();
    });
}

asio::any_io_executor Session::get_executor() const {
    return impl_->strand_;
}

ClientState Session::get_state() const {
    return impl_->state_.load();
}

std::optional<std::string> Session::banner() const {
    std::lock_guard lock(impl_->banner_mutex_);
    return impl_->banner_;
}

} // namespace Ami

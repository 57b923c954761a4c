// include/onchain/json_rpc_stream.hpp
#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace onchain {

struct WsEndpoint {
    std::string host;
    std::string port;
    std::string path;
};

/// "wss://host[:port]/path?query" -> {host, port (default 443), path}.
/// Throws std::invalid_argument for anything that is not a wss:// URL.
WsEndpoint parse_ws_url(const std::string& url);

/// {"jsonrpc":"2.0","id":id,"method":method,"params":params}
nlohmann::json make_rpc_request(std::uint64_t id, const std::string& method, nlohmann::json params);

// One TLS WebSocket connection to a JSON-RPC node, driven by its own
// io_context thread.
//
// start() spawns the thread, which connects, performs the TLS and WebSocket
// handshakes, sends the subscribe request and then reads until stopped or
// the connection fails. Every parsed message is passed to the message
// handler on the stream thread; transport failures go to the error handler
// (once), never out of the thread.
class JsonRpcStream {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using ErrorHandler   = std::function<void(const std::string&)>;

    JsonRpcStream(std::string name, WsEndpoint endpoint);
    ~JsonRpcStream();

    JsonRpcStream(const JsonRpcStream&)            = delete;
    JsonRpcStream& operator=(const JsonRpcStream&) = delete;

    void start(nlohmann::json subscribe_request, MessageHandler on_message, ErrorHandler on_error);

    // Queue a request on the connection. Safe from any thread, including
    // from inside the message handler.
    void send(const nlohmann::json& request);

    // Close the socket and join the thread. Idempotent.
    void stop();

    bool running() const noexcept { return running_.load(); }
    const std::string& name() const noexcept { return name_; }

private:
    struct Session;

    void run(nlohmann::json subscribe_request);
    void read_next();
    void write_next();
    void fail(const std::string& what);

    std::string name_;
    WsEndpoint  endpoint_;

    MessageHandler on_message_;
    ErrorHandler   on_error_;

    std::unique_ptr<Session> session_;
    std::thread              thread_;
    std::atomic<bool>        running_{false};
    std::atomic<bool>        stopping_{false};
    std::atomic<bool>        failed_{false};
};

} // namespace onchain

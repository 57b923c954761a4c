// src/onchain/json_rpc_stream.cpp
#include "onchain/json_rpc_stream.hpp"
#include "utils/log.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <spdlog/spdlog.h>

#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>

namespace onchain {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using     tcp       = net::ip::tcp;

using json = nlohmann::json;

WsEndpoint parse_ws_url(const std::string& url)
{
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("expected a wss:// URL, got: " + url);
    }

    const std::string rest  = url.substr(scheme.size());
    const auto        slash = rest.find_first_of("/?");
    std::string authority   = rest.substr(0, slash);
    std::string path        = slash == std::string::npos ? "/" : rest.substr(slash);
    if (!path.empty() && path.front() == '?') {
        path.insert(path.begin(), '/');
    }

    WsEndpoint ep;
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = "443";
    }
    ep.path = path;

    if (ep.host.empty() || ep.port.empty()) {
        throw std::invalid_argument("bad WebSocket URL: " + url);
    }
    return ep;
}

json make_rpc_request(std::uint64_t id, const std::string& method, json params)
{
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

struct JsonRpcStream::Session {
    net::io_context ioc;
    ssl::context    ctx{ssl::context::tls_client};

    std::optional<websocket::stream<beast::ssl_stream<beast::tcp_stream>>> ws;

    beast::flat_buffer      buffer;
    std::deque<std::string> outbox; // only touched on the io thread
};

JsonRpcStream::JsonRpcStream(std::string name, WsEndpoint endpoint)
    : name_(std::move(name))
    , endpoint_(std::move(endpoint))
{
}

JsonRpcStream::~JsonRpcStream()
{
    stop();
}

void JsonRpcStream::start(json subscribe_request, MessageHandler on_message, ErrorHandler on_error)
{
    if (running_.exchange(true)) {
        return;
    }
    on_message_ = std::move(on_message);
    on_error_   = std::move(on_error);
    stopping_   = false;
    failed_     = false;

    session_ = std::make_unique<Session>();
    thread_  = std::thread([this, req = std::move(subscribe_request)]() mutable { run(std::move(req)); });
}

void JsonRpcStream::run(json subscribe_request)
{
    Session& s = *session_;

    try {
        s.ctx.set_default_verify_paths();
        s.ctx.set_verify_mode(ssl::verify_peer);

        tcp::resolver resolver{s.ioc};
        auto const results = resolver.resolve(endpoint_.host, endpoint_.port);

        s.ws.emplace(s.ioc, s.ctx);
        auto& ws = *s.ws;

        // SNI
        if (! ::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }

        beast::get_lowest_layer(ws).connect(results);
        ws.next_layer().handshake(ssl::stream_base::client);

        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([this](websocket::request_type& req) {
            req.set(http::field::host, endpoint_.host);
            req.set(http::field::user_agent, std::string("mempool-copytrade/ws"));
        }));
        ws.handshake(endpoint_.host, endpoint_.path);

        const std::string sub = subscribe_request.dump();
        ws.write(net::buffer(sub));

        spdlog::info("ws connected {}", utils::fields({{"stream", name_}, {"host", endpoint_.host}}));
    } catch (const std::exception& ex) {
        if (!stopping_) {
            fail(ex.what());
        }
        return;
    }

    read_next();

    try {
        s.ioc.run();
    } catch (const std::exception& ex) {
        if (!stopping_) {
            fail(ex.what());
        }
    }
}

void JsonRpcStream::send(const json& request)
{
    if (!running_ || !session_) {
        return;
    }

    Session* s = session_.get();
    net::post(s->ioc, [this, s, text = request.dump()]() mutable {
        if (!s->ws || !s->ws->is_open()) {
            return;
        }
        s->outbox.push_back(std::move(text));
        if (s->outbox.size() == 1) {
            write_next();
        }
    });
}

void JsonRpcStream::read_next()
{
    Session& s = *session_;
    s.buffer.clear();
    s.ws->async_read(s.buffer, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            if (!stopping_) {
                fail(ec == websocket::error::closed ? std::string("connection closed by peer") : ec.message());
            }
            return;
        }

        const auto        data = session_->buffer.data();
        const std::string text{static_cast<const char*>(data.data()), data.size()};

        json msg = json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (msg.is_discarded()) {
            spdlog::warn("ws json parse error {}", utils::fields({{"stream", name_}, {"raw", text}}));
        } else if (on_message_) {
            try {
                on_message_(msg);
            } catch (const std::exception& ex) {
                spdlog::warn("ws handler error {}", utils::fields({{"stream", name_}, {"err", ex.what()}}));
            }
        }

        read_next();
    });
}

// One async_write in flight at a time; the outbox holds the rest.
void JsonRpcStream::write_next()
{
    Session& s = *session_;
    s.ws->async_write(net::buffer(s.outbox.front()), [this](beast::error_code ec, std::size_t) {
        Session& s = *session_;
        if (ec) {
            s.outbox.clear();
            if (!stopping_) {
                fail(ec.message());
            }
            return;
        }
        s.outbox.pop_front();
        if (!s.outbox.empty()) {
            write_next();
        }
    });
}

void JsonRpcStream::fail(const std::string& what)
{
    if (failed_.exchange(true)) {
        return;
    }
    if (on_error_) {
        on_error_(what);
    } else {
        spdlog::warn("ws error {}", utils::fields({{"stream", name_}, {"err", what}}));
    }
}

void JsonRpcStream::stop()
{
    if (!running_.exchange(false)) {
        return;
    }
    stopping_ = true;

    if (session_) {
        session_->ioc.stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    if (session_ && session_->ws) {
        beast::error_code ec;
        beast::get_lowest_layer(*session_->ws).socket().close(ec);
        // close errors are irrelevant once stopped
    }
    session_.reset();
}

} // namespace onchain

#include "gradia/browser/cdp_client.hpp"
#include "gradia/core/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace gradia::browser {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct CdpClient::Impl {
    net::io_context& ioc;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    std::string url;
    std::atomic<bool> connected{false};
    std::atomic<int> next_id{1};

    std::mutex pending_mutex;
    std::unordered_map<int, std::function<void(Result<json>)>> pending;

    explicit Impl(net::io_context& ctx) : ioc(ctx) {}

    auto allocate_id() -> int {
        return next_id.fetch_add(1, std::memory_order_relaxed);
    }

    void dispatch_message(const std::string& msg) {
        json j;
        try {
            j = json::parse(msg);
        } catch (const json::exception& e) {
            LOG_WARN("Failed to parse CDP message: {}", e.what());
            return;
        }

        // Events (no "id") are not consumed; page state is polled instead.
        if (!j.contains("id")) return;

        std::function<void(Result<json>)> callback;
        {
            std::lock_guard lock(pending_mutex);
            auto it = pending.find(j["id"].get<int>());
            if (it == pending.end()) return;
            callback = std::move(it->second);
            pending.erase(it);
        }

        if (j.contains("error")) {
            const auto& err = j["error"];
            callback(std::unexpected(
                make_error(ErrorCode::ProtocolError,
                           err.value("message", "CDP error"),
                           err.contains("data") ? err["data"].dump() : "")));
        } else {
            callback(j.value("result", json::object()));
        }
    }

    void fail_pending() {
        std::unordered_map<int, std::function<void(Result<json>)>> drained;
        {
            std::lock_guard lock(pending_mutex);
            drained.swap(pending);
        }
        for (auto& [id, callback] : drained) {
            callback(std::unexpected(
                make_error(ErrorCode::ConnectionClosed, "CDP connection closed")));
        }
    }
};

CdpClient::CdpClient(boost::asio::io_context& ioc)
    : impl_(std::make_unique<Impl>(ioc)) {}

CdpClient::~CdpClient() {
    abort();
}

auto CdpClient::connect(std::string_view ws_url) -> awaitable<Result<void>> {
    impl_->url = std::string(ws_url);

    try {
        std::string url_str(ws_url);
        size_t start = 0;
        if (url_str.starts_with("ws://")) {
            start = 5;
        } else {
            co_return make_fail(
                make_error(ErrorCode::InvalidArgument,
                           "Unsupported DevTools endpoint", url_str));
        }

        auto path_pos = url_str.find('/', start);
        auto host_port = url_str.substr(start, path_pos - start);
        std::string target = (path_pos != std::string::npos) ? url_str.substr(path_pos) : "/";

        std::string host = host_port;
        std::string port = "9222";
        if (auto colon = host_port.find(':'); colon != std::string::npos) {
            host = host_port.substr(0, colon);
            port = host_port.substr(colon + 1);
        }

        tcp::resolver resolver(impl_->ioc);
        auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

        impl_->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(impl_->ioc);

        auto ep = co_await beast::get_lowest_layer(*impl_->ws).async_connect(
            results, net::use_awaitable);

        // The driver enforces deadlines on every blocking call, so the
        // stream itself never expires.
        beast::get_lowest_layer(*impl_->ws).expires_never();
        impl_->ws->set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        impl_->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "gradia-cdp/1.0");
            }));
        // Full DOM trees of rendered pages easily exceed the default limit.
        impl_->ws->read_message_max(64 * 1024 * 1024);

        co_await impl_->ws->async_handshake(host + ":" + std::to_string(ep.port()),
                                            target, net::use_awaitable);

        impl_->connected = true;
        LOG_DEBUG("CDP connected to {}", url_str);

        net::co_spawn(impl_->ioc,
            [impl = impl_.get()]() -> awaitable<void> {
                beast::flat_buffer buffer;
                while (impl->connected) {
                    try {
                        co_await impl->ws->async_read(buffer, net::use_awaitable);
                        auto msg = beast::buffers_to_string(buffer.data());
                        buffer.consume(buffer.size());
                        impl->dispatch_message(msg);
                    } catch (const beast::system_error& se) {
                        if (se.code() != websocket::error::closed &&
                            se.code() != net::error::operation_aborted) {
                            LOG_DEBUG("CDP read loop ended: {}", se.what());
                        }
                        impl->connected = false;
                        break;
                    }
                }
                impl->fail_pending();
            },
            net::detached);

        co_return ok_result();
    } catch (const beast::system_error& se) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Failed to connect to CDP", se.what()));
    }
}

auto CdpClient::send_command(std::string_view method, json params,
                             std::string_view session_id)
    -> awaitable<Result<json>> {
    if (!impl_->connected) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed,
                       "CDP client not connected", std::string(method)));
    }

    int id = impl_->allocate_id();

    json message = {
        {"id", id},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };
    if (!session_id.empty()) {
        message["sessionId"] = std::string(session_id);
    }

    using channel_t = net::experimental::concurrent_channel<void(
        boost::system::error_code, Result<json>)>;
    auto channel = std::make_shared<channel_t>(impl_->ioc, 1);

    {
        std::lock_guard lock(impl_->pending_mutex);
        impl_->pending[id] = [channel](Result<json> result) {
            channel->try_send(boost::system::error_code{}, std::move(result));
        };
    }

    try {
        auto msg_str = message.dump();
        co_await impl_->ws->async_write(net::buffer(msg_str), net::use_awaitable);
    } catch (const beast::system_error& se) {
        {
            std::lock_guard lock(impl_->pending_mutex);
            impl_->pending.erase(id);
        }
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Failed to send CDP command",
                       std::string(method) + ": " + se.what()));
    }

    auto result = co_await channel->async_receive(net::use_awaitable);
    co_return result;
}

auto CdpClient::disconnect() -> awaitable<void> {
    if (!impl_->connected) {
        co_return;
    }
    impl_->connected = false;

    if (impl_->ws) {
        try {
            co_await impl_->ws->async_close(websocket::close_code::normal,
                                            net::use_awaitable);
        } catch (const beast::system_error& se) {
            LOG_DEBUG("CDP close handshake failed: {}", se.what());
        }
    }
    LOG_DEBUG("CDP disconnected from {}", impl_->url);
}

void CdpClient::abort() noexcept {
    if (!impl_) return;
    impl_->connected = false;
    if (impl_->ws) {
        beast::error_code ec;
        beast::get_lowest_layer(*impl_->ws).socket().close(ec);
    }
}

auto CdpClient::is_connected() const -> bool {
    return impl_ && impl_->connected;
}

auto CdpClient::ws_url() const -> std::string_view {
    return impl_->url;
}

} // namespace gradia::browser

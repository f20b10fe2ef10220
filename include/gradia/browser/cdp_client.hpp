#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include "gradia/core/error.hpp"

namespace gradia::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Chrome DevTools Protocol WebSocket client.
///
/// Speaks to the browser-level endpoint; commands aimed at a page are routed
/// through a flattened target session by passing its session id.
class CdpClient {
public:
    explicit CdpClient(boost::asio::io_context& ioc);
    ~CdpClient();

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;

    /// Connect to the DevTools WebSocket endpoint (ws://host:port/devtools/...).
    auto connect(std::string_view ws_url) -> awaitable<Result<void>>;

    /// Send a CDP command and await its result.
    /// session_id: target session from Target.attachToTarget, empty for the browser.
    auto send_command(std::string_view method, json params = json::object(),
                      std::string_view session_id = {})
        -> awaitable<Result<json>>;

    /// Close the WebSocket. Pending commands fail with ConnectionClosed.
    auto disconnect() -> awaitable<void>;

    /// Drop the connection without a closing handshake.
    void abort() noexcept;

    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto ws_url() const -> std::string_view;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gradia::browser

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <sys/types.h>

#include "gradia/browser/cdp_client.hpp"
#include "gradia/browser/engine.hpp"

namespace gradia::browser {

/// Launches a dedicated headless Chrome/Chromium process per driver and
/// drives it over the DevTools protocol.
class ChromeEngine final : public Engine {
public:
    ChromeEngine() = default;

    auto launch(const LaunchOptions& options)
        -> Result<std::unique_ptr<Driver>> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "chrome"; }

    /// Locate a Chrome binary: explicit path first, then well-known
    /// locations, then PATH. Empty when none is found.
    [[nodiscard]] static auto find_chrome(const std::optional<std::string>& configured)
        -> std::string;
};

/// One Chrome process with one incognito page target attached.
class ChromeDriver final : public Driver {
public:
    ChromeDriver(std::string id, pid_t pid, std::filesystem::path user_data_dir);
    ~ChromeDriver() override;

    ChromeDriver(const ChromeDriver&) = delete;
    ChromeDriver& operator=(const ChromeDriver&) = delete;

    /// Connect to the browser endpoint and open the isolated page target.
    auto attach(std::string_view ws_url, const LaunchOptions& options) -> VoidResult;

    auto navigate(std::string_view url, std::chrono::milliseconds timeout)
        -> VoidResult override;
    auto wait_until_settled(std::chrono::milliseconds delay,
                            std::chrono::milliseconds timeout)
        -> VoidResult override;
    auto capture_document(std::chrono::milliseconds timeout)
        -> Result<DomNode> override;
    auto close() -> VoidResult override;
    void terminate() noexcept override;

    [[nodiscard]] auto id() const -> std::string_view override { return id_; }

    /// The process was already reaped by someone else; its pid may be
    /// reused, so never signal or wait on it again.
    void mark_exited() noexcept { pid_ = 0; }

private:
    /// Run one CDP coroutine on the private io_context until it completes
    /// or the deadline passes. A missed deadline kills the browser.
    template <typename T>
    auto run_blocking(awaitable<Result<T>> op, std::chrono::milliseconds timeout,
                      std::string_view what) -> Result<T>;

    auto open_target(LaunchOptions options) -> awaitable<Result<void>>;
    auto dispose_target() -> awaitable<Result<void>>;
    auto page_command(std::string_view method, json params = json::object())
        -> awaitable<Result<json>>;
    auto evaluate(std::string_view expression) -> awaitable<Result<json>>;
    auto wait_for_load(std::chrono::milliseconds timeout) -> awaitable<Result<void>>;

    void reap() noexcept;

    std::string id_;
    std::atomic<pid_t> pid_;
    std::filesystem::path user_data_dir_;
    std::string session_id_;
    std::string browser_context_id_;
    std::atomic<bool> broken_{false};

    boost::asio::io_context ioc_;
    std::unique_ptr<CdpClient> cdp_;
};

} // namespace gradia::browser

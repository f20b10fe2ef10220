#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gradia/browser/dom.hpp"
#include "gradia/core/config.hpp"
#include "gradia/core/error.hpp"

namespace gradia::browser {

/// Isolation and presentation options fixed at handle creation.
struct LaunchOptions {
    bool headless = true;
    bool incognito = true;
    bool disable_extensions = true;
    int viewport_width = 1920;
    int viewport_height = 1080;
    std::string user_agent = kDefaultUserAgent;
    std::optional<std::string> chrome_path;
    std::chrono::milliseconds launch_timeout{10000};
};

/// Builds launch options from the browser section of the configuration.
auto launch_options_from(const BrowserConfig& config) -> LaunchOptions;

/// One live automation-engine instance: a single isolated browsing context.
///
/// Every call blocks the calling thread. Implementations must fail (not hang)
/// once a call's deadline passes, and terminate() must be callable from any
/// thread while another thread is inside a blocking call.
class Driver {
public:
    virtual ~Driver() = default;

    /// Load `url` and wait for the document to finish loading.
    virtual auto navigate(std::string_view url, std::chrono::milliseconds timeout)
        -> VoidResult = 0;

    /// Give client-side rendering time to finish after the load event.
    virtual auto wait_until_settled(std::chrono::milliseconds delay,
                                    std::chrono::milliseconds timeout)
        -> VoidResult = 0;

    /// Snapshot the rendered document.
    virtual auto capture_document(std::chrono::milliseconds timeout)
        -> Result<DomNode> = 0;

    /// Graceful teardown of the context and the engine process.
    virtual auto close() -> VoidResult = 0;

    /// Forced teardown; never throws, safe to repeat.
    virtual void terminate() noexcept = 0;

    [[nodiscard]] virtual auto id() const -> std::string_view = 0;
};

/// Factory for drivers. Shared by the pool for the lifetime of the process.
class Engine {
public:
    virtual ~Engine() = default;

    virtual auto launch(const LaunchOptions& options)
        -> Result<std::unique_ptr<Driver>> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace gradia::browser

#include "gradia/browser/chrome_engine.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/core/utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gradia::browser {

namespace fs = std::filesystem;
namespace net = boost::asio;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Launch helpers
// ---------------------------------------------------------------------------

namespace {

auto build_chrome_args(const std::string& chrome_path, const LaunchOptions& options,
                       const fs::path& user_data_dir) -> std::vector<std::string> {
    std::vector<std::string> args = {
        chrome_path,
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-gpu",
        "--disable-dev-shm-usage",
        "--no-sandbox",
        "--disable-background-networking",
        "--disable-sync",
        "--disable-translate",
        "--disable-features=TranslateUI",
        "--disable-notifications",
        "--disable-popup-blocking",
        "--disable-infobars",
        "--mute-audio",
        "--window-size=" + std::to_string(options.viewport_width) + "," +
            std::to_string(options.viewport_height),
        "--user-agent=" + options.user_agent,
        // Port 0 lets Chrome pick a free port and publish it in
        // DevToolsActivePort, so concurrent launches never collide.
        "--remote-debugging-port=0",
        "--user-data-dir=" + user_data_dir.string(),
    };
    if (options.headless) {
        args.emplace_back("--headless=new");
    }
    if (options.disable_extensions) {
        args.emplace_back("--disable-extensions");
    }
    if (options.incognito) {
        args.emplace_back("--incognito");
    }
    args.emplace_back("about:blank");
    return args;
}

/// Reads "<port>\n<browser path>" written by Chrome once DevTools is listening.
auto read_devtools_endpoint(const fs::path& user_data_dir) -> std::optional<std::string> {
    std::ifstream in(user_data_dir / "DevToolsActivePort");
    if (!in.is_open()) return std::nullopt;

    std::string port;
    std::string path;
    if (!std::getline(in, port) || !std::getline(in, path)) return std::nullopt;

    port = utils::trim(port);
    path = utils::trim(path);
    if (port.empty() || path.empty() || !utils::parse_int(port)) return std::nullopt;
    return "ws://127.0.0.1:" + port + path;
}

void remove_user_data_dir(const fs::path& dir) {
    if (dir.empty()) return;
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG_WARN("Failed to remove browser profile {}: {}", dir.string(), ec.message());
    }
}

} // anonymous namespace

auto launch_options_from(const BrowserConfig& config) -> LaunchOptions {
    LaunchOptions options;
    options.headless = config.headless;
    options.incognito = config.incognito;
    options.disable_extensions = config.disable_extensions;
    options.viewport_width = config.viewport_width;
    options.viewport_height = config.viewport_height;
    options.user_agent = config.user_agent;
    options.chrome_path = config.chrome_path;
    options.launch_timeout = std::chrono::milliseconds(config.launch_timeout_ms);
    return options;
}

// ---------------------------------------------------------------------------
// ChromeEngine
// ---------------------------------------------------------------------------

auto ChromeEngine::launch(const LaunchOptions& options)
    -> Result<std::unique_ptr<Driver>> {
    auto chrome_path = find_chrome(options.chrome_path);
    if (chrome_path.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig,
                       "Chrome/Chromium not found",
                       "Set browser.chrome_path or GRADIA_CHROME_PATH"));
    }

    auto instance_id = utils::generate_id(12);
    std::error_code ec;
    auto temp_dir = fs::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(
            make_error(ErrorCode::IoError, "No usable temporary directory",
                       ec.message()));
    }
    auto user_data_dir = temp_dir / ("gradia-chrome-" + instance_id);

    fs::create_directories(user_data_dir, ec);
    if (ec) {
        return std::unexpected(
            make_error(ErrorCode::IoError,
                       "Failed to create browser profile directory",
                       user_data_dir.string() + ": " + ec.message()));
    }

    // Everything the child touches is prepared before fork().
    auto args = build_chrome_args(chrome_path, options, user_data_dir);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        if (devnull >= 0) ::close(devnull);
        remove_user_data_dir(user_data_dir);
        return std::unexpected(
            make_error(ErrorCode::EngineCrashed,
                       "Failed to fork Chrome process",
                       "errno=" + std::to_string(errno)));
    }

    if (pid == 0) {
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    if (devnull >= 0) ::close(devnull);

    // From here on the driver owns the process and the profile directory;
    // every early return below tears both down through its destructor.
    auto driver = std::make_unique<ChromeDriver>(instance_id, pid, user_data_dir);

    auto deadline = std::chrono::steady_clock::now() + options.launch_timeout;
    std::optional<std::string> ws_url;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            driver->mark_exited();
            return std::unexpected(
                make_error(ErrorCode::EngineCrashed,
                           "Chrome exited during startup",
                           "status=" + std::to_string(status)));
        }
        ws_url = read_devtools_endpoint(user_data_dir);
        if (ws_url) break;
        std::this_thread::sleep_for(50ms);
    }

    if (!ws_url) {
        return std::unexpected(
            make_error(ErrorCode::EngineTimeout,
                       "Chrome DevTools endpoint did not come up",
                       std::to_string(options.launch_timeout.count()) + "ms"));
    }

    auto attached = driver->attach(*ws_url, options);
    if (!attached) {
        return std::unexpected(attached.error());
    }

    LOG_DEBUG("Chrome launched (pid={}, id={}, endpoint={})", pid, instance_id, *ws_url);
    return driver;
}

auto ChromeEngine::find_chrome(const std::optional<std::string>& configured) -> std::string {
    if (configured) {
        return fs::exists(*configured) ? *configured : std::string{};
    }

    static const std::vector<std::string> paths = {
        "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable",
        "/usr/bin/chromium",
        "/usr/bin/chromium-browser",
        "/snap/bin/chromium",
        "/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
        "/Applications/Chromium.app/Contents/MacOS/Chromium",
    };

    for (const auto& p : paths) {
        if (fs::exists(p)) {
            return p;
        }
    }

    if (const auto* path_env = std::getenv("PATH")) {
        const std::vector<const char*> names = {
            "google-chrome", "google-chrome-stable", "chromium", "chromium-browser",
        };
        for (const auto& dir : utils::split(path_env, ':')) {
            for (const auto* name : names) {
                auto full = fs::path(dir) / name;
                if (fs::exists(full)) {
                    return full.string();
                }
            }
        }
    }

    return {};
}

// ---------------------------------------------------------------------------
// ChromeDriver
// ---------------------------------------------------------------------------

ChromeDriver::ChromeDriver(std::string id, pid_t pid, fs::path user_data_dir)
    : id_(std::move(id)),
      pid_(pid),
      user_data_dir_(std::move(user_data_dir)),
      cdp_(std::make_unique<CdpClient>(ioc_)) {}

ChromeDriver::~ChromeDriver() {
    terminate();
    cdp_.reset();
    reap();
}

template <typename T>
auto ChromeDriver::run_blocking(awaitable<Result<T>> op,
                                std::chrono::milliseconds timeout,
                                std::string_view what) -> Result<T> {
    if (broken_) {
        return std::unexpected(
            make_error(ErrorCode::EngineCrashed,
                       "Browser instance is no longer usable", id_));
    }

    ioc_.restart();
    auto future = net::co_spawn(ioc_, std::move(op), net::use_future);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (future.wait_for(0s) != std::future_status::ready) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Browser {} {} exceeded {}ms, killing it", id_, what, timeout.count());
            terminate();
            return std::unexpected(
                make_error(ErrorCode::EngineTimeout,
                           std::string(what) + " timed out",
                           std::to_string(timeout.count()) + "ms"));
        }
        if (ioc_.run_one_until(deadline) == 0 && ioc_.stopped() &&
            future.wait_for(0s) != std::future_status::ready) {
            terminate();
            return std::unexpected(
                make_error(ErrorCode::EngineCrashed,
                           "Browser event loop ran out of work", std::string(what)));
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        terminate();
        return std::unexpected(
            make_error(ErrorCode::BrowserError,
                       std::string(what) + " failed", e.what()));
    }
}

auto ChromeDriver::attach(std::string_view ws_url, const LaunchOptions& options)
    -> VoidResult {
    auto connected = run_blocking(cdp_->connect(ws_url), options.launch_timeout,
                                  "DevTools connect");
    if (!connected) return connected;

    return run_blocking(open_target(options), options.launch_timeout, "target setup");
}

auto ChromeDriver::open_target(LaunchOptions options) -> awaitable<Result<void>> {
    json target_params = {{"url", "about:blank"}};

    if (options.incognito) {
        auto context = co_await cdp_->send_command("Target.createBrowserContext", {
            {"disposeOnDetach", true},
        });
        if (!context) co_return make_fail(context.error());
        browser_context_id_ = (*context)["browserContextId"].get<std::string>();
        target_params["browserContextId"] = browser_context_id_;
    }

    auto target = co_await cdp_->send_command("Target.createTarget", target_params);
    if (!target) co_return make_fail(target.error());

    auto attached = co_await cdp_->send_command("Target.attachToTarget", {
        {"targetId", (*target)["targetId"]},
        {"flatten", true},
    });
    if (!attached) co_return make_fail(attached.error());
    session_id_ = (*attached)["sessionId"].get<std::string>();

    auto page = co_await page_command("Page.enable");
    if (!page) co_return make_fail(page.error());

    auto metrics = co_await page_command("Emulation.setDeviceMetricsOverride", {
        {"width", options.viewport_width},
        {"height", options.viewport_height},
        {"deviceScaleFactor", 1},
        {"mobile", false},
    });
    if (!metrics) {
        LOG_WARN("Failed to fix viewport on {}: {}", id_, metrics.error().what());
    }

    auto agent = co_await page_command("Network.setUserAgentOverride", {
        {"userAgent", options.user_agent},
    });
    if (!agent) {
        LOG_WARN("Failed to override user agent on {}: {}", id_, agent.error().what());
    }

    co_return ok_result();
}

auto ChromeDriver::page_command(std::string_view method, json params)
    -> awaitable<Result<json>> {
    co_return co_await cdp_->send_command(method, std::move(params), session_id_);
}

auto ChromeDriver::evaluate(std::string_view expression) -> awaitable<Result<json>> {
    auto result = co_await page_command("Runtime.evaluate", {
        {"expression", std::string(expression)},
        {"returnByValue", true},
    });
    if (!result) co_return make_fail(result.error());

    if (result->contains("exceptionDetails")) {
        co_return make_fail(
            make_error(ErrorCode::BrowserError, "Script evaluation failed",
                       (*result)["exceptionDetails"].value("text", "exception")));
    }
    co_return (*result)["result"].value("value", json());
}

auto ChromeDriver::wait_for_load(std::chrono::milliseconds timeout)
    -> awaitable<Result<void>> {
    net::steady_timer timer(co_await net::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        auto state = co_await evaluate("document.readyState + '|' + location.href");
        if (!state) co_return make_fail(state.error());

        if (state->is_string()) {
            auto parts = utils::split(state->get<std::string>(), '|');
            if (parts.size() >= 2 && parts[0] == "complete" && parts[1] != "about:blank") {
                co_return ok_result();
            }
        }

        timer.expires_after(100ms);
        co_await timer.async_wait(net::use_awaitable);
    }

    co_return make_fail(
        make_error(ErrorCode::EngineTimeout, "Page load timed out",
                   std::to_string(timeout.count()) + "ms"));
}

auto ChromeDriver::navigate(std::string_view url, std::chrono::milliseconds timeout)
    -> VoidResult {
    auto op = [](ChromeDriver* self, std::string target,
                 std::chrono::milliseconds limit) -> awaitable<Result<void>> {
        auto nav = co_await self->page_command("Page.navigate", {{"url", target}});
        if (!nav) co_return make_fail(nav.error());

        if (nav->contains("errorText") && !(*nav)["errorText"].get<std::string>().empty()) {
            co_return make_fail(
                make_error(ErrorCode::BrowserError, "Navigation failed",
                           (*nav)["errorText"].get<std::string>()));
        }
        co_return co_await self->wait_for_load(limit);
    };

    auto result = run_blocking(op(this, std::string(url), timeout), timeout, "navigation");
    if (result) {
        LOG_DEBUG("Browser {} loaded {}", id_, std::string(url));
    }
    return result;
}

auto ChromeDriver::wait_until_settled(std::chrono::milliseconds delay,
                                      std::chrono::milliseconds timeout)
    -> VoidResult {
    auto op = [](ChromeDriver* self, std::chrono::milliseconds settle,
                 std::chrono::milliseconds limit) -> awaitable<Result<void>> {
        net::steady_timer timer(co_await net::this_coro::executor);
        timer.expires_after(settle);
        co_await timer.async_wait(net::use_awaitable);
        co_return co_await self->wait_for_load(limit);
    };
    return run_blocking(op(this, delay, timeout), delay + timeout, "settle wait");
}

auto ChromeDriver::capture_document(std::chrono::milliseconds timeout)
    -> Result<DomNode> {
    auto op = [](ChromeDriver* self) -> awaitable<Result<DomNode>> {
        auto doc = co_await self->page_command("DOM.getDocument", {
            {"depth", -1},
            {"pierce", true},
        });
        if (!doc) co_return make_fail(doc.error());
        if (!doc->contains("root")) {
            co_return make_fail(
                make_error(ErrorCode::ProtocolError, "DOM.getDocument returned no root"));
        }
        co_return from_cdp_node((*doc)["root"]);
    };
    return run_blocking(op(this), timeout, "document capture");
}

auto ChromeDriver::dispose_target() -> awaitable<Result<void>> {
    if (!browser_context_id_.empty()) {
        auto disposed = co_await cdp_->send_command("Target.disposeBrowserContext", {
            {"browserContextId", browser_context_id_},
        });
        if (!disposed) {
            LOG_DEBUG("Failed to dispose browser context on {}: {}", id_,
                      disposed.error().what());
        }
    }
    auto closed = co_await cdp_->send_command("Browser.close");
    // Chrome may drop the socket before answering Browser.close.
    if (!closed && closed.error().code() != ErrorCode::ConnectionClosed) {
        co_return make_fail(closed.error());
    }
    co_return ok_result();
}

auto ChromeDriver::close() -> VoidResult {
    VoidResult graceful;
    if (!broken_ && cdp_->is_connected()) {
        graceful = run_blocking(dispose_target(), 3s, "browser close");
    }

    // Give the process a moment to exit on its own before killing it.
    auto pid = pid_.load();
    if (pid > 0) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        int status = 0;
        while (std::chrono::steady_clock::now() < deadline) {
            if (::waitpid(pid, &status, WNOHANG) == pid) {
                pid_ = 0;
                break;
            }
            std::this_thread::sleep_for(50ms);
        }
    }

    terminate();
    cdp_->abort();
    reap();
    return graceful;
}

void ChromeDriver::terminate() noexcept {
    broken_ = true;
    auto pid = pid_.load();
    if (pid > 0) {
        ::kill(pid, SIGKILL);
    }
}

void ChromeDriver::reap() noexcept {
    auto pid = pid_.exchange(0);
    if (pid > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
    }
    remove_user_data_dir(user_data_dir_);
    user_data_dir_.clear();
}

} // namespace gradia::browser

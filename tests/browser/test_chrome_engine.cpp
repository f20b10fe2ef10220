#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#include "gradia/browser/chrome_engine.hpp"

using namespace gradia::browser;
using gradia::ErrorCode;

namespace {

constexpr const char* kExitsImmediately = "/bin/true";

/// Restores an environment variable when the test leaves scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const auto* old = std::getenv(name)) old_ = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

auto spawn_sleeper() -> pid_t {
    pid_t pid = ::fork();
    if (pid == 0) {
        ::pause();
        ::_exit(0);
    }
    return pid;
}

} // anonymous namespace

TEST_CASE("A browser that exits during startup is a crash", "[chrome]") {
    if (!std::filesystem::exists(kExitsImmediately)) {
        WARN("no /bin/true on this system");
        return;
    }

    LaunchOptions options;
    options.chrome_path = kExitsImmediately;
    options.launch_timeout = std::chrono::milliseconds(5000);

    ChromeEngine engine;
    auto driver = engine.launch(options);
    REQUIRE_FALSE(driver.has_value());
    CHECK(driver.error().code() == ErrorCode::EngineCrashed);
    CHECK(driver.error().message() == "Chrome exited during startup");
}

TEST_CASE("Missing browser binary is a configuration error", "[chrome]") {
    LaunchOptions options;
    options.chrome_path = "/nonexistent/gradia/chrome";

    ChromeEngine engine;
    auto driver = engine.launch(options);
    REQUIRE_FALSE(driver.has_value());
    CHECK(driver.error().code() == ErrorCode::InvalidConfig);
}

TEST_CASE("Unusable TMPDIR is reported instead of thrown", "[chrome]") {
    if (!std::filesystem::exists(kExitsImmediately)) {
        WARN("no /bin/true on this system");
        return;
    }
    ScopedEnv tmpdir("TMPDIR", "/nonexistent/gradia-tmp");

    LaunchOptions options;
    options.chrome_path = kExitsImmediately;

    ChromeEngine engine;
    auto driver = engine.launch(options);
    REQUIRE_FALSE(driver.has_value());
    CHECK(driver.error().code() == ErrorCode::IoError);
}

TEST_CASE("ChromeDriver only signals a process it still owns", "[chrome]") {
    SECTION("mark_exited leaves the pid alone") {
        auto pid = spawn_sleeper();
        REQUIRE(pid > 0);
        {
            ChromeDriver driver("sleeper", pid, {});
            driver.mark_exited();
        }
        int status = 0;
        // Still running and still our child: neither killed nor reaped.
        CHECK(::waitpid(pid, &status, WNOHANG) == 0);

        ::kill(pid, SIGKILL);
        CHECK(::waitpid(pid, &status, 0) == pid);
    }

    SECTION("an owned process is killed and reaped on destruction") {
        auto pid = spawn_sleeper();
        REQUIRE(pid > 0);
        {
            ChromeDriver driver("sleeper", pid, {});
        }
        int status = 0;
        CHECK(::waitpid(pid, &status, WNOHANG) == -1);
    }
}

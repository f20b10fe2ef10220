#pragma once

#include <chrono>
#include <functional>
#include <string_view>
#include <vector>

#include "gradia/browser/driver_pool.hpp"
#include "gradia/core/error.hpp"
#include "gradia/core/types.hpp"
#include "gradia/timetable/extractor.hpp"
#include "gradia/timetable/url_validator.hpp"

namespace gradia::timetable {

enum class ScrapeState {
    Validating,
    Acquiring,
    Navigating,
    Extracting,
    Retrying,
    Succeeded,
    Exhausted,
    Failed,
};

auto to_string(ScrapeState state) -> std::string_view;

struct ExecutorOptions {
    std::chrono::milliseconds settle_delay{2000};
    std::chrono::milliseconds retry_backoff{1000};
};

/// Called on every state transition with the 1-based attempt number
/// (0 while validating).
using StateObserver = std::function<void(ScrapeState state, int attempt)>;

/// Runs one parse request end to end on the calling thread:
/// validate, lease a fresh handle, navigate, settle, capture, extract.
/// Transient engine failures are retried up to max_retries times; every
/// attempt releases its handle before the next one starts.
class ScrapeExecutor {
public:
    ScrapeExecutor(browser::DriverPool& pool, const UrlValidator& validator,
                   const Extractor& extractor, ExecutorOptions options = {});

    void set_observer(StateObserver observer);

    /// Blocking. Returns the entries or one final typed failure.
    auto run(const ParseRequest& request) -> Result<std::vector<TimetableEntry>>;

private:
    auto execute(const ParseRequest& request) -> Result<std::vector<TimetableEntry>>;
    auto attempt(const ParseRequest& request, int attempt_no)
        -> Result<std::vector<TimetableEntry>>;
    void notify(ScrapeState state, int attempt) const;

    browser::DriverPool& pool_;
    const UrlValidator& validator_;
    const Extractor& extractor_;
    ExecutorOptions options_;
    StateObserver observer_;
};

/// Final error surfaced after every attempt failed transiently.
auto exhausted_error(const Error& last, int attempts) -> Error;

} // namespace gradia::timetable

#include "gradia/timetable/scrape_executor.hpp"
#include "gradia/core/logger.hpp"

#include <algorithm>
#include <thread>

namespace gradia::timetable {

auto to_string(ScrapeState state) -> std::string_view {
    switch (state) {
        case ScrapeState::Validating: return "validating";
        case ScrapeState::Acquiring: return "acquiring";
        case ScrapeState::Navigating: return "navigating";
        case ScrapeState::Extracting: return "extracting";
        case ScrapeState::Retrying: return "retrying";
        case ScrapeState::Succeeded: return "succeeded";
        case ScrapeState::Exhausted: return "exhausted";
        case ScrapeState::Failed: return "failed";
    }
    return "unknown";
}

auto exhausted_error(const Error& last, int attempts) -> Error {
    ErrorCode code = ErrorCode::EngineUnavailable;
    switch (last.code()) {
        case ErrorCode::EngineTimeout:
        case ErrorCode::Timeout:
            code = ErrorCode::EngineTimeout;
            break;
        case ErrorCode::EmptyTimetable:
            code = ErrorCode::EmptyTimetable;
            break;
        default:
            break;
    }
    return make_error(code,
                      "Timetable could not be loaded after " +
                          std::to_string(attempts) + " attempts",
                      "attempts=" + std::to_string(attempts) + "; last=" +
                          std::string(error_code_to_string(last.code())) + ": " +
                          last.what());
}

ScrapeExecutor::ScrapeExecutor(browser::DriverPool& pool, const UrlValidator& validator,
                               const Extractor& extractor, ExecutorOptions options)
    : pool_(pool),
      validator_(validator),
      extractor_(extractor),
      options_(options) {}

void ScrapeExecutor::set_observer(StateObserver observer) {
    observer_ = std::move(observer);
}

void ScrapeExecutor::notify(ScrapeState state, int attempt) const {
    LOG_TRACE("Scrape state -> {} (attempt {})", to_string(state), attempt);
    if (observer_) {
        observer_(state, attempt);
    }
}

auto ScrapeExecutor::run(const ParseRequest& request)
    -> Result<std::vector<TimetableEntry>> {
    try {
        return execute(request);
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected failure parsing {}: {}", request.url, e.what());
        notify(ScrapeState::Failed, 0);
        return std::unexpected(
            make_error(ErrorCode::InternalError, "Unexpected scrape failure", e.what()));
    }
}

auto ScrapeExecutor::execute(const ParseRequest& request)
    -> Result<std::vector<TimetableEntry>> {
    notify(ScrapeState::Validating, 0);
    auto valid = validator_.validate(request.url);
    if (!valid) {
        LOG_INFO("Rejected timetable URL: {}", valid.error().what());
        notify(ScrapeState::Failed, 0);
        return std::unexpected(valid.error());
    }

    const int max_attempts = std::max(0, request.max_retries) + 1;

    for (int attempt_no = 1; attempt_no <= max_attempts; ++attempt_no) {
        auto result = attempt(request, attempt_no);
        if (result) {
            notify(ScrapeState::Succeeded, attempt_no);
            LOG_INFO("Parsed {} entries from {} (attempt {}/{})", result->size(),
                     request.url, attempt_no, max_attempts);
            return result;
        }

        const auto& error = result.error();
        switch (failure_kind(error.code())) {
            case FailureKind::TransientEngine:
                if (attempt_no < max_attempts) {
                    LOG_WARN("Attempt {}/{} for {} failed: {}; retrying in {}ms",
                             attempt_no, max_attempts, request.url, error.what(),
                             options_.retry_backoff.count());
                    notify(ScrapeState::Retrying, attempt_no);
                    std::this_thread::sleep_for(options_.retry_backoff);
                    continue;
                }
                LOG_ERROR("Giving up on {} after {} attempts: {}", request.url,
                          max_attempts, error.what());
                notify(ScrapeState::Exhausted, attempt_no);
                return std::unexpected(exhausted_error(error, max_attempts));

            case FailureKind::PoolExhausted:
                LOG_WARN("No browser handle for {}: {}", request.url, error.what());
                notify(ScrapeState::Failed, attempt_no);
                return std::unexpected(error);

            case FailureKind::Validation:
            case FailureKind::Extraction:
            case FailureKind::Unexpected:
                LOG_ERROR("Attempt {}/{} for {} failed permanently: [{}] {}", attempt_no,
                          max_attempts, request.url, error_code_to_string(error.code()),
                          error.what());
                notify(ScrapeState::Failed, attempt_no);
                return std::unexpected(error);
        }
    }

    // max_attempts >= 1, so every path above returns.
    return std::unexpected(
        make_error(ErrorCode::InternalError, "Retry loop ended without a result"));
}

auto ScrapeExecutor::attempt(const ParseRequest& request, int attempt_no)
    -> Result<std::vector<TimetableEntry>> {
    notify(ScrapeState::Acquiring, attempt_no);
    auto lease = pool_.acquire();
    if (!lease) return std::unexpected(lease.error());

    // The lease destroys the handle on every exit path below.
    auto timeout = request.navigation_timeout.count() > 0 ? request.navigation_timeout
                                                          : lease->navigation_timeout();
    auto& driver = lease->driver();

    notify(ScrapeState::Navigating, attempt_no);
    auto loaded = driver.navigate(request.url, timeout);
    if (!loaded) return std::unexpected(loaded.error());

    auto settled = driver.wait_until_settled(options_.settle_delay, timeout);
    if (!settled) return std::unexpected(settled.error());

    auto document = driver.capture_document(timeout);
    if (!document) return std::unexpected(document.error());

    notify(ScrapeState::Extracting, attempt_no);
    return extractor_.extract(*document);
}

} // namespace gradia::timetable

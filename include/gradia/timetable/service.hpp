#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "gradia/browser/driver_pool.hpp"
#include "gradia/browser/engine.hpp"
#include "gradia/core/config.hpp"
#include "gradia/core/error.hpp"
#include "gradia/core/types.hpp"
#include "gradia/timetable/admission.hpp"
#include "gradia/timetable/async_bridge.hpp"
#include "gradia/timetable/extractor.hpp"
#include "gradia/timetable/scrape_executor.hpp"
#include "gradia/timetable/url_validator.hpp"

namespace gradia::timetable {

/// Composition root of the scrape pipeline. Owns the driver pool, the
/// worker pool and the admission gate for the lifetime of the process.
class TimetableService {
public:
    /// Fails with InvalidConfig when the configuration is inconsistent.
    static auto create(boost::asio::any_io_executor executor, const Config& config,
                       std::shared_ptr<browser::Engine> engine)
        -> Result<std::unique_ptr<TimetableService>>;

    ~TimetableService();

    TimetableService(const TimetableService&) = delete;
    TimetableService& operator=(const TimetableService&) = delete;

    /// Admission gate, then one worker job running the retrying executor.
    auto parse_timetable(std::string url) -> awaitable<Result<std::vector<TimetableEntry>>>;

    /// Refuse new work and kill every live browser. Does not block.
    void shutdown();

    [[nodiscard]] auto pool() const -> const browser::DriverPool& { return *pool_; }
    [[nodiscard]] auto admission() const -> const AdmissionController& { return *admission_; }
    [[nodiscard]] auto is_shut_down() const -> bool { return closed_.load(); }

    void set_observer(StateObserver observer);

private:
    TimetableService(boost::asio::any_io_executor executor, const Config& config,
                     std::shared_ptr<browser::Engine> engine, Extractor extractor);

    int max_retries_;
    std::chrono::milliseconds navigation_timeout_;
    std::atomic<bool> closed_{false};

    UrlValidator validator_;
    Extractor extractor_;
    std::unique_ptr<browser::DriverPool> pool_;
    std::unique_ptr<ScrapeExecutor> executor_;
    std::unique_ptr<AsyncBridge> bridge_;
    std::unique_ptr<AdmissionController> admission_;
};

} // namespace gradia::timetable

#include "gradia/timetable/service.hpp"
#include "gradia/core/logger.hpp"

namespace gradia::timetable {

auto TimetableService::create(boost::asio::any_io_executor executor, const Config& config,
                              std::shared_ptr<browser::Engine> engine)
    -> Result<std::unique_ptr<TimetableService>> {
    auto valid = validate_config(config);
    if (!valid) return std::unexpected(valid.error());

    ExtractorOptions extractor_options;
    extractor_options.pixels_per_hour = config.scraper.pixels_per_hour;
    auto extractor = Extractor::create(std::move(extractor_options));
    if (!extractor) return std::unexpected(extractor.error());

    return std::unique_ptr<TimetableService>(new TimetableService(
        std::move(executor), config, std::move(engine), std::move(*extractor)));
}

TimetableService::TimetableService(boost::asio::any_io_executor executor,
                                   const Config& config,
                                   std::shared_ptr<browser::Engine> engine,
                                   Extractor extractor)
    : max_retries_(config.scraper.max_retries),
      navigation_timeout_(config.scraper.navigation_timeout_ms),
      validator_(config.scraper.allowed_domains),
      extractor_(std::move(extractor)) {
    browser::PoolOptions pool_options;
    pool_options.max_handles = config.scraper.max_handles;
    pool_options.navigation_timeout = navigation_timeout_;
    pool_options.launch = browser::launch_options_from(config.browser);
    pool_ = std::make_unique<browser::DriverPool>(std::move(engine), std::move(pool_options));

    ExecutorOptions executor_options;
    executor_options.settle_delay = std::chrono::milliseconds(config.scraper.settle_delay_ms);
    executor_options.retry_backoff = std::chrono::milliseconds(config.scraper.retry_backoff_ms);
    executor_ = std::make_unique<ScrapeExecutor>(*pool_, validator_, extractor_,
                                                 executor_options);

    bridge_ = std::make_unique<AsyncBridge>(effective_worker_threads(config.scraper));
    admission_ = std::make_unique<AdmissionController>(std::move(executor),
                                                       config.scraper.admission_slots);

    LOG_INFO("TimetableService ready (handles={}, slots={}, workers={}, retries={})",
             config.scraper.max_handles, config.scraper.admission_slots,
             bridge_->thread_count(), max_retries_);
}

TimetableService::~TimetableService() {
    shutdown();
    // Workers may still be finishing a job that touches the pool.
    bridge_->join();
}

void TimetableService::set_observer(StateObserver observer) {
    executor_->set_observer(std::move(observer));
}

void TimetableService::shutdown() {
    if (closed_.exchange(true)) return;
    LOG_INFO("TimetableService shutting down");
    pool_->shutdown_all();
}

auto TimetableService::parse_timetable(std::string url)
    -> awaitable<Result<std::vector<TimetableEntry>>> {
    if (closed_) {
        co_return make_fail(make_error(ErrorCode::PoolClosed, "Service is shut down"));
    }

    auto slot = co_await admission_->acquire();
    if (closed_) {
        co_return make_fail(make_error(ErrorCode::PoolClosed, "Service is shut down"));
    }

    ParseRequest request;
    request.url = std::move(url);
    request.max_retries = max_retries_;
    request.navigation_timeout = navigation_timeout_;

    try {
        co_return co_await bridge_->run(
            [this, request] { return executor_->run(request); });
    } catch (const std::exception& e) {
        LOG_ERROR("Worker failure while parsing {}: {}", request.url, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError, "Worker failure", e.what()));
    }
}

} // namespace gradia::timetable

#include "gradia/browser/driver_pool.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/core/utils.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace gradia::browser {

auto to_string(LeaseState state) -> std::string_view {
    switch (state) {
        case LeaseState::Free: return "free";
        case LeaseState::Leased: return "leased";
        case LeaseState::Doomed: return "doomed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Lease
// ---------------------------------------------------------------------------

Lease::Lease(DriverPool* pool, std::shared_ptr<Handle> handle)
    : pool_(pool), handle_(std::move(handle)) {}

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      handle_(std::move(other.handle_)) {}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        handle_ = std::move(other.handle_);
    }
    return *this;
}

auto Lease::id() const -> std::string_view {
    return handle_ ? std::string_view(handle_->id) : std::string_view{};
}

auto Lease::navigation_timeout() const -> std::chrono::milliseconds {
    return handle_ ? handle_->navigation_timeout : std::chrono::milliseconds{0};
}

auto Lease::driver() -> Driver& {
    return *handle_->driver;
}

void Lease::release() {
    if (pool_ && handle_) {
        pool_->release(*this);
    }
}

// ---------------------------------------------------------------------------
// DriverPool::Impl
// ---------------------------------------------------------------------------

struct DriverPool::Impl {
    std::shared_ptr<Engine> engine;
    PoolOptions options;

    mutable std::mutex mutex;
    size_t active = 0;  // leased or being created
    bool closed = false;
    std::unordered_map<std::string, std::shared_ptr<Handle>> tracked;
    PoolStats stats;

    Impl(std::shared_ptr<Engine> eng, PoolOptions opts)
        : engine(std::move(eng)), options(std::move(opts)) {}

    /// Gives back a slot reserved by acquire().
    void free_slot() {
        std::lock_guard lock(mutex);
        --active;
    }
};

DriverPool::DriverPool(std::shared_ptr<Engine> engine, PoolOptions options)
    : impl_(std::make_unique<Impl>(std::move(engine), std::move(options))) {
    LOG_INFO("DriverPool created (engine={}, max_handles={})",
             impl_->engine->name(), impl_->options.max_handles);
}

DriverPool::~DriverPool() {
    shutdown_all();
}

auto DriverPool::acquire() -> Result<Lease> {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->closed) {
            return std::unexpected(
                make_error(ErrorCode::PoolClosed, "Driver pool is shut down"));
        }
        if (impl_->active >= impl_->options.max_handles) {
            return std::unexpected(
                make_error(ErrorCode::PoolExhausted,
                           "All browser handles are in use",
                           "max_handles=" + std::to_string(impl_->options.max_handles)));
        }
        ++impl_->active;
        impl_->stats.peak_active = std::max(impl_->stats.peak_active, impl_->active);
    }

    // The launch is slow; the reserved slot keeps the cap honest meanwhile.
    Result<std::unique_ptr<Driver>> launched = std::unexpected(
        make_error(ErrorCode::InternalError, "Browser launch did not run"));
    try {
        launched = impl_->engine->launch(impl_->options.launch);
    } catch (const std::exception& e) {
        launched = std::unexpected(
            make_error(ErrorCode::InternalError, "Browser launch threw", e.what()));
    }
    if (!launched) {
        impl_->free_slot();
        {
            std::lock_guard lock(impl_->mutex);
            ++impl_->stats.launch_failures;
        }
        LOG_WARN("Browser launch failed: {}", launched.error().what());
        if (launched.error().code() == ErrorCode::InvalidConfig) {
            return std::unexpected(launched.error());
        }
        return std::unexpected(
            make_error(ErrorCode::EngineCrashed, "Failed to launch browser",
                       launched.error().what()));
    }

    auto handle = std::make_shared<Handle>();
    handle->id = std::string((*launched)->id());
    handle->created_at_ms = utils::timestamp_ms();
    handle->state = LeaseState::Leased;
    handle->navigation_timeout = impl_->options.navigation_timeout;
    handle->driver = std::move(*launched);

    bool closed_meanwhile = false;
    {
        std::lock_guard lock(impl_->mutex);
        ++impl_->stats.created;
        if (impl_->closed) {
            closed_meanwhile = true;
            handle->state = LeaseState::Doomed;
        } else {
            impl_->tracked.emplace(handle->id, handle);
        }
    }

    if (closed_meanwhile) {
        // shutdown_all() ran while this instance was starting up.
        Lease doomed(this, handle);
        release(doomed);
        return std::unexpected(
            make_error(ErrorCode::PoolClosed, "Driver pool is shut down"));
    }

    LOG_DEBUG("Leased browser handle {} ({}/{} active)", handle->id,
              active_count(), impl_->options.max_handles);
    return Lease(this, std::move(handle));
}

void DriverPool::release(Lease& lease) {
    auto handle = std::move(lease.handle_);
    lease.pool_ = nullptr;
    if (!handle) return;

    {
        std::lock_guard lock(impl_->mutex);
        impl_->tracked.erase(handle->id);
        handle->state = LeaseState::Doomed;
    }

    if (handle->driver) {
        auto closed = handle->driver->close();
        if (!closed) {
            LOG_WARN("Error closing browser handle {}: {}", handle->id,
                     closed.error().what());
        }
        handle->driver.reset();
    }

    size_t remaining = 0;
    {
        std::lock_guard lock(impl_->mutex);
        --impl_->active;
        ++impl_->stats.destroyed;
        remaining = impl_->active;
    }
    LOG_DEBUG("Destroyed browser handle {} ({} active)", handle->id, remaining);
}

void DriverPool::shutdown_all() {
    size_t terminated = 0;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->closed && impl_->tracked.empty()) return;
        impl_->closed = true;
        // Owners are blocked inside the driver; killing the process makes
        // their call fail promptly and their lease then destroys the handle.
        // Done under the lock so release() cannot reset the driver meanwhile.
        for (auto& [id, handle] : impl_->tracked) {
            handle->state = LeaseState::Doomed;
            if (handle->driver) {
                handle->driver->terminate();
                ++terminated;
            }
        }
    }
    LOG_INFO("DriverPool shut down ({} handles terminated)", terminated);
}

auto DriverPool::active_count() const -> size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->active;
}

auto DriverPool::max_size() const -> size_t {
    return impl_->options.max_handles;
}

auto DriverPool::is_closed() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->closed;
}

auto DriverPool::stats() const -> PoolStats {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats;
}

} // namespace gradia::browser
